#pragma once

#include <QObject>
#include <QString>

namespace sacore {

enum class DeviceFailure {
    None,
    AlreadyActive,
    NotActive,
    Unavailable,
    IoError,
};

struct DeviceResult {
    bool ok = false;
    DeviceFailure failure = DeviceFailure::None;
    QString message;

    [[nodiscard]] bool success() const { return ok; }

    static DeviceResult succeeded() { return {true, DeviceFailure::None, {}}; }
    static DeviceResult failed(DeviceFailure failure, const QString& message) { return {false, failure, message}; }
};

struct CaptureStatus {
    bool recording = false;
    qint64 durationMs = 0;
    QString path;
};

enum class InterruptionKind {
    Paused,
    Interrupted,
};

// Audio input used by the recorder. activate() acquires the input in a mode
// that keeps capturing while the process is backgrounded; beginStream()
// writes one capture file until endStream().
class CaptureDevice : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;
    ~CaptureDevice() override = default;

    virtual DeviceResult activate() = 0;
    virtual void deactivate() = 0;
    [[nodiscard]] virtual bool isActive() const = 0;

    virtual DeviceResult beginStream(const QString& filePath) = 0;
    virtual DeviceResult endStream() = 0;
    [[nodiscard]] virtual CaptureStatus status() const = 0;

signals:
    void interruptionBegan(sacore::InterruptionKind kind, const QString& reason);
    void interruptionEnded();
};

}  // namespace sacore
