#pragma once

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>

#include <functional>
#include <optional>
#include <stdexcept>

#include "sacore/capture_device.hpp"
#include "sacore/clock.hpp"
#include "sacore/keep_alive.hpp"
#include "sacore/permission_gate.hpp"
#include "sacore/storage_monitor.hpp"
#include "sacore/telemetry.hpp"
#include "sacore/wav_file.hpp"

namespace sacore::testing {

inline constexpr qint64 kMiB = 1024LL * 1024;

class ManualClock final : public Clock {
public:
    explicit ManualClock(qint64 nowMs = 1700000000000LL)
        : nowMs_(nowMs) {}

    [[nodiscard]] qint64 nowMs() const override { return nowMs_; }
    void set(qint64 nowMs) { nowMs_ = nowMs; }
    void advance(qint64 deltaMs) { nowMs_ += deltaMs; }

private:
    qint64 nowMs_;
};

// Writes a real WAV file per stream. Duration follows the manual clock
// while the stream is open and freezes when it ends.
class FakeCaptureDevice final : public CaptureDevice {
public:
    explicit FakeCaptureDevice(const ManualClock* clock)
        : clock_(clock) {}

    DeviceResult activate() override {
        ++activateCalls;
        if (activateResult.success()) {
            active_ = true;
        }
        return activateResult;
    }

    void deactivate() override {
        ++deactivateCalls;
        active_ = false;
    }

    [[nodiscard]] bool isActive() const override { return active_; }

    DeviceResult beginStream(const QString& filePath) override {
        ++beginCalls;
        if (streaming_) {
            return DeviceResult::failed(DeviceFailure::AlreadyActive, "Stream already running.");
        }
        if (failNextBegin) {
            failNextBegin = false;
            return DeviceResult::failed(DeviceFailure::Unavailable, "Input busy.");
        }
        openStream(filePath);
        return DeviceResult::succeeded();
    }

    DeviceResult endStream() override {
        ++endCalls;
        if (!streaming_) {
            return DeviceResult::failed(DeviceFailure::NotActive, "No stream.");
        }
        lastDurationMs_ = clock_->nowMs() - streamStartedAtMs_;
        streaming_ = false;
        writer_.write(QByteArray(320, '\0'));
        writer_.close();
        if (failNextEnd) {
            failNextEnd = false;
            return DeviceResult::failed(DeviceFailure::IoError, "Disk full.");
        }
        return DeviceResult::succeeded();
    }

    [[nodiscard]] CaptureStatus status() const override {
        CaptureStatus status;
        status.recording = streaming_;
        status.path = path_;
        status.durationMs = streaming_ ? clock_->nowMs() - streamStartedAtMs_ : lastDurationMs_;
        return status;
    }

    // A stream some earlier owner left running.
    void startExternalStream(const QString& filePath) { openStream(filePath); }

    void beginInterruption(InterruptionKind kind, const QString& reason) { emit interruptionBegan(kind, reason); }
    void endInterruption() { emit interruptionEnded(); }

    [[nodiscard]] bool isStreaming() const { return streaming_; }
    [[nodiscard]] QString currentPath() const { return path_; }

    DeviceResult activateResult = DeviceResult::succeeded();
    bool failNextBegin = false;
    bool failNextEnd = false;
    int activateCalls = 0;
    int deactivateCalls = 0;
    int beginCalls = 0;
    int endCalls = 0;

private:
    void openStream(const QString& filePath) {
        QDir().mkpath(QFileInfo(filePath).absolutePath());
        writer_.open(filePath, PcmFormat {});
        streaming_ = true;
        path_ = filePath;
        streamStartedAtMs_ = clock_->nowMs();
    }

    const ManualClock* clock_;
    WavFileWriter writer_;
    bool active_ = false;
    bool streaming_ = false;
    QString path_;
    qint64 streamStartedAtMs_ = 0;
    qint64 lastDurationMs_ = 0;
};

class FakePermission final : public PermissionGate {
public:
    [[nodiscard]] PermissionState state() const override { return current; }
    PermissionState request() override {
        ++requestCalls;
        current = afterRequest;
        return current;
    }
    bool openSystemSettings() override {
        ++settingsCalls;
        return settingsResult;
    }

    PermissionState current {true, true};
    PermissionState afterRequest {true, true};
    int requestCalls = 0;
    int settingsCalls = 0;
    bool settingsResult = true;
};

class FakeFreeSpace final : public FreeSpaceProbe {
public:
    [[nodiscard]] std::optional<qint64> freeBytes() const override { return value; }

    std::optional<qint64> value = 10LL * 1024 * kMiB;
};

class RecordingKeepAlive final : public KeepAlive {
public:
    bool acquire(const QString& reason) override {
        Q_UNUSED(reason);
        ++acquireCalls;
        held_ = succeed;
        return succeed;
    }
    void release() override {
        ++releaseCalls;
        held_ = false;
    }
    [[nodiscard]] bool isHeld() const override { return held_; }

    bool succeed = true;
    int acquireCalls = 0;
    int releaseCalls = 0;

private:
    bool held_ = false;
};

class ThrowingTelemetry final : public TelemetrySink {
public:
    void track(const QString& name, const QJsonObject& payload) override {
        Q_UNUSED(name);
        Q_UNUSED(payload);
        throw std::runtime_error("sink offline");
    }

    void recordDurationMs(const QString& key, qint64 durationMs) override {
        Q_UNUSED(key);
        Q_UNUSED(durationMs);
        throw std::runtime_error("sink offline");
    }
};

inline bool waitUntil(const std::function<bool()>& predicate, int timeoutMs = 2000) {
    QElapsedTimer elapsed;
    elapsed.start();
    while (!predicate()) {
        if (elapsed.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
    return true;
}

inline void writeFile(const QString& path, const QByteArray& contents) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(contents);
    }
}

}  // namespace sacore::testing
