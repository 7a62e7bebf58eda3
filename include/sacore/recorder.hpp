#pragma once

#include <QFuture>
#include <QObject>
#include <QString>
#include <QStringList>

#include <optional>

#include "sacore/capture_device.hpp"
#include "sacore/recorder_events.hpp"
#include "sacore/segment_rotator.hpp"
#include "sacore/transition_queue.hpp"
#include "sacore/types.hpp"

namespace sacore {

class Clock;
class KeepAlive;
class PermissionGate;
class RecordingStore;
class StorageMonitor;
class TelemetrySink;

struct StartRequest {
    QString sessionId;
    ContextDescriptor descriptor;
    QStringList contextKeys;
    SessionReason reason = SessionReason::Auto;
};

struct StartResult {
    bool started = false;
    bool alreadyRunning = false;
    std::optional<Session> session;
    std::optional<EngineError> error;
};

// Owns the capture device lifecycle. Every transition runs through one
// TransitionQueue, so at most one device operation is in flight.
class Recorder final : public QObject {
    Q_OBJECT

public:
    struct Dependencies {
        CaptureDevice* device = nullptr;
        PermissionGate* permission = nullptr;
        StorageMonitor* storage = nullptr;
        RecordingStore* store = nullptr;
        KeepAlive* keepAlive = nullptr;
        const Clock* clock = nullptr;
        TelemetrySink* telemetry = nullptr;
    };

    Recorder(const Dependencies& deps, qint64 segmentDurationMs, QObject* parent = nullptr);

    QFuture<StartResult> start(const StartRequest& request);
    QFuture<void> stop(const QString& reason = "manual-stop");
    QFuture<void> updateSessionContext(const QStringList& contextKeys);
    QFuture<void> rotateSegment();

    [[nodiscard]] RecorderState state() const { return state_; }
    [[nodiscard]] bool isRunning() const { return state_ == RecorderState::Running && session_.has_value(); }
    [[nodiscard]] std::optional<Session> activeSession() const { return session_; }
    [[nodiscard]] bool hasOpenSegment() const { return rotator_.hasOpenSegment(); }
    [[nodiscard]] bool isRotationScheduled() const { return rotator_.isTimerActive(); }
    EventChannel& events() { return events_; }

    static QString generateSessionId(qint64 nowMs);

private:
    StartResult doStart(const StartRequest& request);
    void doStop(const QString& reason);
    void doRotate(quint64 sessionToken);
    void doInterruptionBegan(InterruptionKind kind, const QString& reason);
    void doInterruptionEnded();

    StartResult failStart(ErrorCode code, const QString& message);
    void setSessionState(SessionState next, const QString& reason);
    void releaseResources();

    Dependencies deps_;
    SegmentRotator rotator_;
    TransitionQueue queue_;
    EventChannel events_;

    RecorderState state_ = RecorderState::Idle;
    std::optional<Session> session_;
    ContextDescriptor descriptor_;
    quint64 sessionToken_ = 0;
};

}  // namespace sacore

