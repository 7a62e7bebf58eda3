#include "sacore/segment_rotator.hpp"

#include <QElapsedTimer>

#include <climits>

#include "sacore/clock.hpp"
#include "sacore/logging.hpp"
#include "sacore/telemetry.hpp"

namespace sacore {

SegmentRotator::SegmentRotator(
    CaptureDevice* device,
    RecordingStore* store,
    const Clock* clock,
    qint64 segmentDurationMs,
    TelemetrySink* telemetry,
    QObject* parent)
    : QObject(parent),
      device_(device),
      store_(store),
      clock_(clock),
      segmentDurationMs_(qBound<qint64>(1, segmentDurationMs, INT_MAX)),
      telemetry_(telemetry) {
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, [this]() {
        if (rotationHandler_) {
            rotationHandler_(timerToken_);
        }
    });
}

void SegmentRotator::setRotationHandler(RotationHandler handler) {
    rotationHandler_ = std::move(handler);
}

DeviceResult SegmentRotator::openSegment(
    const QString& sessionId,
    const ContextDescriptor& descriptor,
    quint64 sessionToken) {
    if (current_) {
        return DeviceResult::failed(DeviceFailure::AlreadyActive, "A segment is already open.");
    }

    const auto target = store_->allocateSegment(sessionId, clock_->nowMs());
    if (!target) {
        return DeviceResult::failed(DeviceFailure::IoError, "Unable to prepare the session directory.");
    }

    const DeviceResult result = device_->beginStream(target->path);
    if (!result.success()) {
        qCWarning(lcRotation) << "Unable to open segment" << target->path << result.message;
        return result;
    }

    current_ = target;
    descriptor_ = descriptor;
    armTimer(sessionToken);
    qCDebug(lcRotation) << "Opened segment" << target->recordingId << "for session" << sessionId;
    return result;
}

void SegmentRotator::adoptActiveStream(
    const QString& sessionId,
    const ContextDescriptor& descriptor,
    const CaptureStatus& status,
    quint64 sessionToken) {
    const qint64 nowMs = clock_->nowMs();
    SegmentTarget target;
    target.sessionId = sessionId;
    target.path = status.path;
    target.createdAtMs = nowMs - qMax<qint64>(0, status.durationMs);
    target.recordingId = RecordingStore::generateRecordingId(nowMs);
    current_ = target;
    descriptor_ = descriptor;
    armTimer(sessionToken);
    qCInfo(lcRotation) << "Adopted active capture stream" << status.path;
}

FinalizeOutcome SegmentRotator::finalizeSegment() {
    FinalizeOutcome outcome;
    timer_.stop();
    if (!current_) {
        return outcome;
    }

    QElapsedTimer elapsed;
    elapsed.start();

    const SegmentTarget target = *current_;
    current_.reset();

    const DeviceResult stopped = device_->endStream();
    qint64 durationMs = device_->status().durationMs;
    if (durationMs <= 0) {
        durationMs = qMax<qint64>(0, clock_->nowMs() - target.createdAtMs);
    }

    // The file is indexed even when stopping the stream failed.
    outcome.recording = store_->persistSegment(target, durationMs, descriptor_);

    if (!stopped.success()) {
        outcome.error = EngineError {
            ErrorCode::FinalizeFailed,
            QString("Unable to finalize the current segment: %1").arg(stopped.message),
        };
    } else if (!outcome.recording) {
        outcome.error = EngineError {ErrorCode::FinalizeFailed, "Unable to save the current segment."};
    }

    if (outcome.error) {
        qCWarning(lcRotation) << outcome.error->message << target.path;
    } else {
        qCInfo(lcRotation) << "Saved segment" << target.recordingId << durationMs << "ms";
    }
    reportDuration(telemetry_, "safety_audio_segment_finalize", elapsed.elapsed());
    return outcome;
}

void SegmentRotator::cancelTimer() {
    timer_.stop();
}

bool SegmentRotator::beginRotation() {
    if (rotating_) {
        return false;
    }
    rotating_ = true;
    return true;
}

void SegmentRotator::endRotation() {
    rotating_ = false;
}

void SegmentRotator::armTimer(quint64 sessionToken) {
    timerToken_ = sessionToken;
    timer_.start(static_cast<int>(segmentDurationMs_));
}

}  // namespace sacore
