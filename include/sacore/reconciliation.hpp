#pragma once

#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "sacore/types.hpp"

namespace sacore {

enum class OverrideState {
    ForceOn,
    ForceOff,
};

using OverrideMap = QMap<QString, OverrideState>;

struct BookingSession {
    QString bookingId;
    QString status;
};

struct LocationShare {
    QString conversationId;
    QString status;
    qint64 expiresAtMs = 0;
};

struct Evaluation {
    bool shouldRecord = false;
    QStringList contextKeys;

    bool operator==(const Evaluation& other) const {
        return shouldRecord == other.shouldRecord && contextKeys == other.contextKeys;
    }
};

QString toString(OverrideState value);
std::optional<OverrideState> overrideStateFromString(const QString& value);
std::optional<OverrideState> overrideFor(const OverrideMap& overrides, const QString& contextKey);

// Drops blank keys and duplicates, keeping first occurrence order.
QStringList uniqueContextKeys(const QStringList& keys);

QString bookingContextKey(const QString& bookingId);
QString liveLocationContextKey(const QString& conversationId);

QStringList deriveActiveContextKeys(
    const QVector<BookingSession>& bookings,
    const QVector<LocationShare>& shares,
    qint64 nowMs);

ContextDescriptor resolveDescriptor(const QString& contextKey);

// Pure and deterministic. force_on counts globally; force_off only for
// manual:global or an active key, and dominates force_on when both apply.
Evaluation evaluateDesiredState(
    const QStringList& activeContextKeys,
    const OverrideMap& overrides,
    bool autoRecordDefault);

// Keeps force_on entries, keeps manual:global while any context is active,
// and keeps other keys only while they are active.
OverrideMap pruneOverrides(const OverrideMap& overrides, const QStringList& activeContextKeys);

// First candidate pinned force_on, else the first candidate, else manual:global.
QString preferredStartKey(const Evaluation& evaluation, const OverrideMap& overrides);

}  // namespace sacore
