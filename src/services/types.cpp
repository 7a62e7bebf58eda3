#include "sacore/types.hpp"

#include <QDateTime>
#include <QJsonArray>

namespace sacore {

qint64 Session::elapsedMs(qint64 nowMs) const {
    if (state != SessionState::Running) {
        return elapsedMsAtLastStateChange;
    }
    return elapsedMsAtLastStateChange + qMax<qint64>(0, nowMs - lastStateChangedAtMs);
}

QString toString(ContextType value) {
    switch (value) {
    case ContextType::Booking:
        return "booking";
    case ContextType::LiveLocation:
        return "live_location";
    case ContextType::Manual:
        return "manual";
    }
    return "manual";
}

QString toString(RecordingSource value) {
    switch (value) {
    case RecordingSource::Manual:
        return "manual";
    case RecordingSource::AutoBooking:
        return "auto_booking";
    case RecordingSource::AutoLiveLocation:
        return "auto_live_location";
    case RecordingSource::Restarted:
        return "restarted";
    case RecordingSource::CloudDownload:
        return "cloud_download";
    }
    return "manual";
}

QString toString(SessionReason value) {
    return value == SessionReason::Manual ? "manual" : "auto";
}

QString toString(RecorderState value) {
    switch (value) {
    case RecorderState::Idle:
        return "idle";
    case RecorderState::Starting:
        return "starting";
    case RecorderState::Running:
        return "running";
    case RecorderState::Stopping:
        return "stopping";
    }
    return "idle";
}

QString toString(SessionState value) {
    switch (value) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Starting:
        return "starting";
    case SessionState::Running:
        return "running";
    case SessionState::Paused:
        return "paused";
    case SessionState::Interrupted:
        return "interrupted";
    case SessionState::Stopping:
        return "stopping";
    case SessionState::Stopped:
        return "stopped";
    }
    return "idle";
}

QString toString(ErrorCode value) {
    switch (value) {
    case ErrorCode::PermissionDenied:
        return "permission_denied";
    case ErrorCode::DeviceUnavailable:
        return "device_unavailable";
    case ErrorCode::StorageCritical:
        return "storage_critical";
    case ErrorCode::FinalizeFailed:
        return "finalize_failed";
    case ErrorCode::RecoveryPartial:
        return "recovery_partial";
    }
    return "device_unavailable";
}

std::optional<ContextType> contextTypeFromString(const QString& value) {
    if (value == "booking") {
        return ContextType::Booking;
    }
    if (value == "live_location") {
        return ContextType::LiveLocation;
    }
    if (value == "manual") {
        return ContextType::Manual;
    }
    return std::nullopt;
}

std::optional<RecordingSource> recordingSourceFromString(const QString& value) {
    if (value == "manual") {
        return RecordingSource::Manual;
    }
    if (value == "auto_booking") {
        return RecordingSource::AutoBooking;
    }
    if (value == "auto_live_location") {
        return RecordingSource::AutoLiveLocation;
    }
    if (value == "restarted") {
        return RecordingSource::Restarted;
    }
    if (value == "cloud_download") {
        return RecordingSource::CloudDownload;
    }
    return std::nullopt;
}

QString isoTimestamp(qint64 epochMs) {
    return QDateTime::fromMSecsSinceEpoch(epochMs).toUTC().toString(Qt::ISODateWithMs);
}

qint64 parseIsoTimestamp(const QString& value) {
    const QDateTime parsed = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return 0;
    }
    return parsed.toMSecsSinceEpoch();
}

QJsonObject toJson(const Session& session, qint64 nowMs) {
    QJsonArray keys;
    for (const QString& key : session.contextKeys) {
        keys.append(key);
    }
    QJsonObject out;
    out.insert("session_id", session.sessionId);
    out.insert("started_at", isoTimestamp(session.startedAtMs));
    out.insert("segment_started_at", isoTimestamp(session.segmentStartedAtMs));
    out.insert("context_keys", keys);
    out.insert("reason", toString(session.reason));
    out.insert("state", toString(session.state));
    out.insert("last_state_changed_at", isoTimestamp(session.lastStateChangedAtMs));
    out.insert("elapsed_ms", static_cast<double>(session.elapsedMs(nowMs)));
    if (!session.lastInterruptionReason.isEmpty()) {
        out.insert("last_interruption_reason", session.lastInterruptionReason);
    }
    return out;
}

QJsonObject toJson(const Recording& recording) {
    QJsonObject out;
    out.insert("id", recording.id);
    out.insert("session_id", recording.sessionId);
    out.insert("path", recording.path);
    out.insert("created_at", isoTimestamp(recording.createdAtMs));
    out.insert("expires_at", isoTimestamp(recording.expiresAtMs));
    out.insert("duration_ms", static_cast<double>(recording.durationMs));
    out.insert("size_bytes", static_cast<double>(recording.sizeBytes));
    out.insert("context_type", toString(recording.contextType));
    out.insert(
        "context_id",
        recording.contextId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(recording.contextId));
    out.insert("source", toString(recording.source));
    return out;
}

QJsonObject toJson(const StorageStatus& status) {
    QJsonObject out;
    out.insert(
        "free_bytes",
        status.freeBytes ? QJsonValue(static_cast<double>(*status.freeBytes)) : QJsonValue(QJsonValue::Null));
    out.insert("warning", status.warning);
    out.insert("critical", status.critical);
    out.insert("warning_threshold_bytes", static_cast<double>(status.warningThresholdBytes));
    out.insert("critical_threshold_bytes", static_cast<double>(status.criticalThresholdBytes));
    return out;
}

QJsonObject toJson(const EngineError& error) {
    return {
        {"code", toString(error.code)},
        {"message", error.message},
    };
}

std::optional<Recording> recordingFromJson(const QJsonObject& object) {
    Recording recording;
    recording.id = object.value("id").toString();
    recording.path = object.value("path").toString();
    recording.createdAtMs = parseIsoTimestamp(object.value("created_at").toString());
    recording.expiresAtMs = parseIsoTimestamp(object.value("expires_at").toString());
    const auto contextType = contextTypeFromString(object.value("context_type").toString());
    const auto source = recordingSourceFromString(object.value("source").toString());

    if (recording.id.isEmpty() || recording.path.isEmpty() || recording.createdAtMs <= 0
        || recording.expiresAtMs <= 0 || !contextType || !source) {
        return std::nullopt;
    }

    recording.sessionId = object.value("session_id").toString();
    recording.contextType = *contextType;
    recording.source = *source;
    recording.contextId = object.value("context_id").toString().trimmed();
    recording.durationMs = qMax<qint64>(0, static_cast<qint64>(object.value("duration_ms").toDouble(0)));
    recording.sizeBytes = qMax<qint64>(0, static_cast<qint64>(object.value("size_bytes").toDouble(0)));
    return recording;
}

}  // namespace sacore
