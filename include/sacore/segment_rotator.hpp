#pragma once

#include <QObject>
#include <QTimer>

#include <functional>
#include <optional>

#include "sacore/capture_device.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/types.hpp"

namespace sacore {

class Clock;
class TelemetrySink;

struct FinalizeOutcome {
    std::optional<Recording> recording;
    std::optional<EngineError> error;
};

// Cuts one session into fixed-duration capture files. The rotation timer
// only reports that a rotation is due; the owner decides when to run it.
class SegmentRotator final : public QObject {
    Q_OBJECT

public:
    using RotationHandler = std::function<void(quint64 sessionToken)>;

    SegmentRotator(
        CaptureDevice* device,
        RecordingStore* store,
        const Clock* clock,
        qint64 segmentDurationMs,
        TelemetrySink* telemetry = nullptr,
        QObject* parent = nullptr);

    void setRotationHandler(RotationHandler handler);

    DeviceResult openSegment(const QString& sessionId, const ContextDescriptor& descriptor, quint64 sessionToken);

    // Takes over a stream the device is already writing, e.g. one left
    // running by a previous owner of the device.
    void adoptActiveStream(
        const QString& sessionId,
        const ContextDescriptor& descriptor,
        const CaptureStatus& status,
        quint64 sessionToken);

    FinalizeOutcome finalizeSegment();
    void cancelTimer();

    bool beginRotation();
    void endRotation();

    [[nodiscard]] bool isRotating() const { return rotating_; }
    [[nodiscard]] bool hasOpenSegment() const { return current_.has_value(); }
    [[nodiscard]] std::optional<SegmentTarget> openTarget() const { return current_; }
    [[nodiscard]] bool isTimerActive() const { return timer_.isActive(); }
    [[nodiscard]] qint64 segmentDurationMs() const { return segmentDurationMs_; }

private:
    void armTimer(quint64 sessionToken);

    CaptureDevice* device_;
    RecordingStore* store_;
    const Clock* clock_;
    qint64 segmentDurationMs_;
    TelemetrySink* telemetry_;
    RotationHandler rotationHandler_;

    QTimer timer_;
    quint64 timerToken_ = 0;
    std::optional<SegmentTarget> current_;
    ContextDescriptor descriptor_;
    bool rotating_ = false;
};

}  // namespace sacore
