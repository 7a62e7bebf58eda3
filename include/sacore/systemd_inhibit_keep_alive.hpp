#pragma once

#include <QProcess>

#include <memory>

#include "sacore/keep_alive.hpp"

namespace sacore {

// Holds a systemd-inhibit sleep/idle lock for as long as the helper
// process runs.
class SystemdInhibitKeepAlive final : public KeepAlive {
public:
    explicit SystemdInhibitKeepAlive(QString program = "systemd-inhibit", int startTimeoutMs = 3000);
    ~SystemdInhibitKeepAlive() override;

    bool acquire(const QString& reason) override;
    void release() override;
    [[nodiscard]] bool isHeld() const override;

    static QStringList inhibitArguments(const QString& reason);

private:
    QString program_;
    int startTimeoutMs_;
    std::unique_ptr<QProcess> process_;
};

}  // namespace sacore
