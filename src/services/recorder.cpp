#include "sacore/recorder.hpp"

#include <QPromise>

#include <memory>

#include "sacore/clock.hpp"
#include "sacore/keep_alive.hpp"
#include "sacore/logging.hpp"
#include "sacore/permission_gate.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/storage_monitor.hpp"
#include "sacore/telemetry.hpp"

namespace sacore {

namespace {

class RotationGuard {
public:
    explicit RotationGuard(SegmentRotator& rotator)
        : rotator_(rotator),
          acquired_(rotator.beginRotation()) {}
    ~RotationGuard() {
        if (acquired_) {
            rotator_.endRotation();
        }
    }

    RotationGuard(const RotationGuard&) = delete;
    RotationGuard& operator=(const RotationGuard&) = delete;

    [[nodiscard]] bool acquired() const { return acquired_; }

private:
    SegmentRotator& rotator_;
    bool acquired_;
};

QFuture<void> submitVoid(TransitionQueue& queue, std::function<void()> operation) {
    auto promise = std::make_shared<QPromise<void>>();
    QFuture<void> future = promise->future();
    promise->start();
    queue.submit([promise, operation = std::move(operation)]() {
        operation();
        promise->finish();
    });
    return future;
}

}  // namespace

Recorder::Recorder(const Dependencies& deps, qint64 segmentDurationMs, QObject* parent)
    : QObject(parent),
      deps_(deps),
      rotator_(deps.device, deps.store, deps.clock, segmentDurationMs, deps.telemetry) {
    rotator_.setRotationHandler([this](quint64 token) {
        queue_.submit([this, token]() { doRotate(token); });
    });
    connect(deps_.device, &CaptureDevice::interruptionBegan, this,
            [this](InterruptionKind kind, const QString& reason) {
                queue_.submit([this, kind, reason]() { doInterruptionBegan(kind, reason); });
            });
    connect(deps_.device, &CaptureDevice::interruptionEnded, this, [this]() {
        queue_.submit([this]() { doInterruptionEnded(); });
    });
}

QString Recorder::generateSessionId(qint64 nowMs) {
    return QString("safety-audio-session-%1").arg(nowMs);
}

QFuture<StartResult> Recorder::start(const StartRequest& request) {
    auto promise = std::make_shared<QPromise<StartResult>>();
    QFuture<StartResult> future = promise->future();
    promise->start();
    queue_.submit([this, promise, request]() {
        promise->addResult(doStart(request));
        promise->finish();
    });
    return future;
}

QFuture<void> Recorder::stop(const QString& reason) {
    return submitVoid(queue_, [this, reason]() { doStop(reason); });
}

QFuture<void> Recorder::updateSessionContext(const QStringList& contextKeys) {
    return submitVoid(queue_, [this, contextKeys]() {
        if (session_) {
            session_->contextKeys = contextKeys;
        }
    });
}

QFuture<void> Recorder::rotateSegment() {
    return submitVoid(queue_, [this]() { doRotate(sessionToken_); });
}

StartResult Recorder::failStart(ErrorCode code, const QString& message) {
    qCWarning(lcRecorder) << "Recorder start failed:" << toString(code) << message;
    state_ = RecorderState::Idle;
    StartResult result;
    result.error = EngineError {code, message};
    return result;
}

StartResult Recorder::doStart(const StartRequest& request) {
    if (session_ && (state_ == RecorderState::Running || state_ == RecorderState::Starting)) {
        session_->contextKeys = request.contextKeys;
        StartResult result;
        result.started = true;
        result.alreadyRunning = true;
        result.session = session_;
        return result;
    }

    if (deps_.storage != nullptr && deps_.storage->refresh().critical) {
        StartResult result;
        result.error = EngineError {
            ErrorCode::StorageCritical,
            "Not enough free storage to record safety audio.",
        };
        qCWarning(lcRecorder) << "Recorder start refused: storage critical";
        return result;
    }

    state_ = RecorderState::Starting;

    PermissionState permission = deps_.permission->state();
    if (!permission.granted) {
        permission = deps_.permission->request();
    }
    if (!permission.granted) {
        return failStart(
            ErrorCode::PermissionDenied,
            permission.canAskAgain
                ? "Microphone permission is required to record safety audio."
                : "Microphone permission was denied. Enable it in system settings to record safety audio.");
    }

    const DeviceResult activated = deps_.device->activate();
    if (!activated.success()) {
        return failStart(ErrorCode::DeviceUnavailable, activated.message);
    }

    const qint64 nowMs = deps_.clock->nowMs();
    const QString sessionId = request.sessionId.trimmed().isEmpty() ? generateSessionId(nowMs) : request.sessionId;
    const quint64 token = ++sessionToken_;

    const DeviceResult opened = rotator_.openSegment(sessionId, request.descriptor, token);
    if (!opened.success()) {
        const CaptureStatus live = deps_.device->status();
        if (opened.failure == DeviceFailure::AlreadyActive && !session_ && live.recording && !live.path.isEmpty()) {
            qCWarning(lcRecorder) << "Capture device already recording, adopting its stream";
            rotator_.adoptActiveStream(sessionId, request.descriptor, live, token);
        } else {
            rotator_.cancelTimer();
            deps_.device->deactivate();
            session_.reset();
            return failStart(
                ErrorCode::DeviceUnavailable,
                opened.message.isEmpty() ? QString("Unable to start audio capture.") : opened.message);
        }
    }

    if (deps_.keepAlive != nullptr && !deps_.keepAlive->acquire("Recording safety audio")) {
        qCWarning(lcRecorder) << "Keep-alive unavailable, continuing without it";
    }

    const qint64 startedAtMs = deps_.clock->nowMs();
    Session session;
    session.sessionId = sessionId;
    session.startedAtMs = startedAtMs;
    session.segmentStartedAtMs = rotator_.openTarget() ? rotator_.openTarget()->createdAtMs : startedAtMs;
    session.contextKeys = request.contextKeys;
    session.reason = request.reason;
    session.state = SessionState::Running;
    session.lastStateChangedAtMs = startedAtMs;
    session.elapsedMsAtLastStateChange = 0;

    session_ = session;
    descriptor_ = request.descriptor;
    state_ = RecorderState::Running;

    qCInfo(lcRecorder) << "Recording session started" << sessionId << "reason" << toString(request.reason);
    reportTelemetry(
        deps_.telemetry,
        "safety_audio_recorder_started",
        {{"sessionId", sessionId},
         {"reason", toString(request.reason)},
         {"contextType", toString(request.descriptor.contextType)}});
    events_.publish(StartedEvent {session});

    StartResult result;
    result.started = true;
    result.session = session;
    return result;
}

void Recorder::doStop(const QString& reason) {
    if (state_ == RecorderState::Idle && !session_ && !rotator_.hasOpenSegment()) {
        return;
    }

    const QString sessionId = session_ ? session_->sessionId : QString();
    state_ = RecorderState::Stopping;

    const FinalizeOutcome outcome = rotator_.finalizeSegment();
    if (outcome.recording) {
        events_.publish(SegmentSavedEvent {*outcome.recording});
    }
    if (outcome.error) {
        events_.publish(ErrorEvent {*outcome.error});
    }

    releaseResources();
    state_ = RecorderState::Idle;
    qCInfo(lcRecorder) << "Recording session stopped" << sessionId << "reason" << reason;
    events_.publish(StoppedEvent {reason, sessionId});
}

void Recorder::doRotate(quint64 sessionToken) {
    if (sessionToken != sessionToken_ || state_ != RecorderState::Running || !session_) {
        return;
    }
    RotationGuard guard(rotator_);
    if (!guard.acquired()) {
        qCWarning(lcRotation) << "Rotation already in progress, skipping";
        return;
    }

    const FinalizeOutcome outcome = rotator_.finalizeSegment();
    if (outcome.recording) {
        events_.publish(SegmentSavedEvent {*outcome.recording});
    }
    if (outcome.error) {
        events_.publish(ErrorEvent {*outcome.error});
        doStop("recording-error");
        return;
    }

    const DeviceResult opened = rotator_.openSegment(session_->sessionId, descriptor_, sessionToken_);
    if (!opened.success()) {
        events_.publish(ErrorEvent {EngineError {
            ErrorCode::DeviceUnavailable,
            opened.message.isEmpty() ? QString("Unable to open the next segment.") : opened.message,
        }});
        doStop("recording-error");
        return;
    }
    session_->segmentStartedAtMs = rotator_.openTarget()->createdAtMs;
}

void Recorder::doInterruptionBegan(InterruptionKind kind, const QString& reason) {
    if (!session_ || state_ != RecorderState::Running || session_->state != SessionState::Running) {
        return;
    }
    session_->lastInterruptionReason = reason;
    setSessionState(kind == InterruptionKind::Paused ? SessionState::Paused : SessionState::Interrupted, reason);
}

void Recorder::doInterruptionEnded() {
    if (!session_ || state_ != RecorderState::Running) {
        return;
    }
    if (session_->state != SessionState::Paused && session_->state != SessionState::Interrupted) {
        return;
    }
    setSessionState(SessionState::Running, "resumed");
}

void Recorder::setSessionState(SessionState next, const QString& reason) {
    const qint64 nowMs = deps_.clock->nowMs();
    const SessionState previous = session_->state;
    session_->elapsedMsAtLastStateChange = session_->elapsedMs(nowMs);
    session_->lastStateChangedAtMs = nowMs;
    session_->state = next;
    qCInfo(lcRecorder) << "Session" << session_->sessionId << toString(previous) << "->" << toString(next) << reason;
    events_.publish(StateChangedEvent {
        session_->sessionId,
        previous,
        next,
        reason,
        session_->elapsedMsAtLastStateChange,
    });
}

void Recorder::releaseResources() {
    rotator_.cancelTimer();
    if (deps_.keepAlive != nullptr && deps_.keepAlive->isHeld()) {
        deps_.keepAlive->release();
    }
    deps_.device->deactivate();
    session_.reset();
    ++sessionToken_;
}

}  // namespace sacore
