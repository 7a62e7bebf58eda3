#include "sacore/reconciliation.hpp"

#include <QSet>

namespace sacore {

namespace {

const QString kBookingPrefix = QStringLiteral("booking:");
const QString kLiveLocationPrefix = QStringLiteral("live_location:");

}  // namespace

QString toString(OverrideState value) {
    return value == OverrideState::ForceOn ? "force_on" : "force_off";
}

std::optional<OverrideState> overrideStateFromString(const QString& value) {
    if (value == "force_on") {
        return OverrideState::ForceOn;
    }
    if (value == "force_off") {
        return OverrideState::ForceOff;
    }
    return std::nullopt;
}

std::optional<OverrideState> overrideFor(const OverrideMap& overrides, const QString& contextKey) {
    const auto it = overrides.constFind(contextKey);
    if (it == overrides.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QStringList uniqueContextKeys(const QStringList& keys) {
    QStringList out;
    QSet<QString> seen;
    for (const QString& key : keys) {
        if (key.trimmed().isEmpty() || seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        out.append(key);
    }
    return out;
}

QString bookingContextKey(const QString& bookingId) {
    return kBookingPrefix + bookingId;
}

QString liveLocationContextKey(const QString& conversationId) {
    return kLiveLocationPrefix + conversationId;
}

QStringList deriveActiveContextKeys(
    const QVector<BookingSession>& bookings,
    const QVector<LocationShare>& shares,
    qint64 nowMs) {
    QStringList keys;
    for (const BookingSession& booking : bookings) {
        if (booking.status == "active" && !booking.bookingId.trimmed().isEmpty()) {
            keys.append(bookingContextKey(booking.bookingId));
        }
    }
    for (const LocationShare& share : shares) {
        if (share.status == "active" && share.expiresAtMs > nowMs
            && !share.conversationId.trimmed().isEmpty()) {
            keys.append(liveLocationContextKey(share.conversationId));
        }
    }
    return uniqueContextKeys(keys);
}

ContextDescriptor resolveDescriptor(const QString& contextKey) {
    ContextDescriptor descriptor;
    if (contextKey.startsWith(kBookingPrefix)) {
        descriptor.contextType = ContextType::Booking;
        descriptor.contextId = contextKey.mid(kBookingPrefix.size());
        descriptor.source = RecordingSource::AutoBooking;
        return descriptor;
    }
    if (contextKey.startsWith(kLiveLocationPrefix)) {
        descriptor.contextType = ContextType::LiveLocation;
        descriptor.contextId = contextKey.mid(kLiveLocationPrefix.size());
        descriptor.source = RecordingSource::AutoLiveLocation;
        return descriptor;
    }
    return descriptor;
}

Evaluation evaluateDesiredState(
    const QStringList& activeContextKeys,
    const OverrideMap& overrides,
    bool autoRecordDefault) {
    const QSet<QString> activeSet(activeContextKeys.cbegin(), activeContextKeys.cend());

    QStringList candidates = activeContextKeys;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        if (it.value() == OverrideState::ForceOn) {
            candidates.append(it.key());
        } else if (it.key() == kManualContextKey || activeSet.contains(it.key())) {
            candidates.append(it.key());
        }
    }

    Evaluation evaluation;
    evaluation.contextKeys = uniqueContextKeys(candidates);
    if (evaluation.contextKeys.isEmpty()) {
        return evaluation;
    }

    bool hasForceOff = false;
    bool hasForceOn = false;
    for (const QString& key : evaluation.contextKeys) {
        const auto state = overrideFor(overrides, key);
        if (!state) {
            continue;
        }
        hasForceOff = hasForceOff || *state == OverrideState::ForceOff;
        hasForceOn = hasForceOn || *state == OverrideState::ForceOn;
    }

    if (hasForceOff) {
        evaluation.shouldRecord = false;
    } else if (hasForceOn) {
        evaluation.shouldRecord = true;
    } else {
        evaluation.shouldRecord = autoRecordDefault && !activeContextKeys.isEmpty();
    }
    return evaluation;
}

OverrideMap pruneOverrides(const OverrideMap& overrides, const QStringList& activeContextKeys) {
    const QSet<QString> activeSet(activeContextKeys.cbegin(), activeContextKeys.cend());
    OverrideMap next;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        if (it.value() == OverrideState::ForceOn) {
            next.insert(it.key(), it.value());
            continue;
        }
        if (it.key() == kManualContextKey) {
            if (!activeSet.isEmpty()) {
                next.insert(it.key(), it.value());
            }
            continue;
        }
        if (activeSet.contains(it.key())) {
            next.insert(it.key(), it.value());
        }
    }
    return next;
}

QString preferredStartKey(const Evaluation& evaluation, const OverrideMap& overrides) {
    for (const QString& key : evaluation.contextKeys) {
        if (overrideFor(overrides, key) == OverrideState::ForceOn) {
            return key;
        }
    }
    if (!evaluation.contextKeys.isEmpty()) {
        return evaluation.contextKeys.first();
    }
    return kManualContextKey;
}

}  // namespace sacore
