#pragma once

#include <QAudioDevice>
#include <QAudioFormat>
#include <QMediaDevices>
#include <QPointer>

#include <memory>

#include "sacore/capture_device.hpp"
#include "sacore/wav_file.hpp"

class QAudioSource;
class QIODevice;

namespace sacore {

// Default audio input recorded as 16 kHz mono 16-bit PCM WAV.
class QtAudioCaptureDevice final : public CaptureDevice {
    Q_OBJECT

public:
    explicit QtAudioCaptureDevice(QObject* parent = nullptr);
    ~QtAudioCaptureDevice() override;

    DeviceResult activate() override;
    void deactivate() override;
    [[nodiscard]] bool isActive() const override { return source_ != nullptr; }

    DeviceResult beginStream(const QString& filePath) override;
    DeviceResult endStream() override;
    [[nodiscard]] CaptureStatus status() const override;

    static QAudioFormat captureFormat();

private:
    void drainInput();
    void onSourceStateChanged(int state);
    void onInputsChanged();

    QMediaDevices mediaDevices_;
    QAudioDevice input_;
    std::unique_ptr<QAudioSource> source_;
    QPointer<QIODevice> inputStream_;
    WavFileWriter writer_;
    bool suspended_ = false;
    qint64 lastDurationMs_ = 0;
    QString lastPath_;
};

}  // namespace sacore
