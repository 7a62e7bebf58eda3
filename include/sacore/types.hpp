#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace sacore {

inline const QString kManualContextKey = QStringLiteral("manual:global");

enum class ContextType {
    Booking,
    LiveLocation,
    Manual,
};

enum class RecordingSource {
    Manual,
    AutoBooking,
    AutoLiveLocation,
    Restarted,
    CloudDownload,
};

enum class SessionReason {
    Manual,
    Auto,
};

enum class RecorderState {
    Idle,
    Starting,
    Running,
    Stopping,
};

enum class SessionState {
    Idle,
    Starting,
    Running,
    Paused,
    Interrupted,
    Stopping,
    Stopped,
};

enum class ErrorCode {
    PermissionDenied,
    DeviceUnavailable,
    StorageCritical,
    FinalizeFailed,
    RecoveryPartial,
};

struct EngineError {
    ErrorCode code = ErrorCode::DeviceUnavailable;
    QString message;
};

struct ContextDescriptor {
    ContextType contextType = ContextType::Manual;
    QString contextId;
    RecordingSource source = RecordingSource::Manual;
};

struct Session {
    QString sessionId;
    qint64 startedAtMs = 0;
    qint64 segmentStartedAtMs = 0;
    QStringList contextKeys;
    SessionReason reason = SessionReason::Manual;
    SessionState state = SessionState::Idle;
    qint64 lastStateChangedAtMs = 0;
    qint64 elapsedMsAtLastStateChange = 0;
    QString lastInterruptionReason;

    // Running time, excluding paused and interrupted spans.
    [[nodiscard]] qint64 elapsedMs(qint64 nowMs) const;
};

struct Recording {
    QString id;
    QString sessionId;
    qint64 createdAtMs = 0;
    qint64 durationMs = 0;
    qint64 sizeBytes = 0;
    QString path;
    ContextType contextType = ContextType::Manual;
    QString contextId;
    RecordingSource source = RecordingSource::Manual;
    qint64 expiresAtMs = 0;

    [[nodiscard]] bool isExpired(qint64 referenceMs) const {
        return expiresAtMs > 0 && expiresAtMs <= referenceMs;
    }
};

struct StorageStatus {
    std::optional<qint64> freeBytes;
    bool warning = false;
    bool critical = false;
    qint64 warningThresholdBytes = 0;
    qint64 criticalThresholdBytes = 0;
};

QString toString(ContextType value);
QString toString(RecordingSource value);
QString toString(SessionReason value);
QString toString(RecorderState value);
QString toString(SessionState value);
QString toString(ErrorCode value);

std::optional<ContextType> contextTypeFromString(const QString& value);
std::optional<RecordingSource> recordingSourceFromString(const QString& value);

QString isoTimestamp(qint64 epochMs);
qint64 parseIsoTimestamp(const QString& value);

QJsonObject toJson(const Session& session, qint64 nowMs);
QJsonObject toJson(const Recording& recording);
QJsonObject toJson(const StorageStatus& status);
QJsonObject toJson(const EngineError& error);
std::optional<Recording> recordingFromJson(const QJsonObject& object);

}  // namespace sacore

Q_DECLARE_METATYPE(sacore::StorageStatus)
