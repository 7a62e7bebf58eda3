#pragma once

#include <QSettings>
#include <QString>

#include "sacore/reconciliation.hpp"

namespace sacore {

// Persists the override map as one JSON value under a fixed settings key.
class OverrideStore {
public:
    explicit OverrideStore(QSettings* settings);

    static QString storageKey();

    OverrideMap load() const;
    bool save(const OverrideMap& overrides);

private:
    QSettings* settings_;
};

}  // namespace sacore
