#include "sacore/qt_audio_capture_device.hpp"

#include <QAudioSource>
#include <QIODevice>

#include "sacore/logging.hpp"

namespace sacore {

QtAudioCaptureDevice::QtAudioCaptureDevice(QObject* parent)
    : CaptureDevice(parent) {
    connect(&mediaDevices_, &QMediaDevices::audioInputsChanged, this, &QtAudioCaptureDevice::onInputsChanged);
}

QtAudioCaptureDevice::~QtAudioCaptureDevice() {
    deactivate();
}

QAudioFormat QtAudioCaptureDevice::captureFormat() {
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);
    return format;
}

DeviceResult QtAudioCaptureDevice::activate() {
    if (source_) {
        return DeviceResult::succeeded();
    }
    input_ = QMediaDevices::defaultAudioInput();
    if (input_.isNull()) {
        return DeviceResult::failed(DeviceFailure::Unavailable, "No audio input device is available.");
    }

    QAudioFormat format = captureFormat();
    if (!input_.isFormatSupported(format)) {
        format = input_.preferredFormat();
        format.setSampleFormat(QAudioFormat::Int16);
        if (!input_.isFormatSupported(format)) {
            return DeviceResult::failed(
                DeviceFailure::Unavailable,
                QString("Audio input %1 does not support 16-bit capture.").arg(input_.description()));
        }
    }

    source_ = std::make_unique<QAudioSource>(input_, format);
    connect(source_.get(), &QAudioSource::stateChanged, this, [this](QAudio::State state) {
        onSourceStateChanged(static_cast<int>(state));
    });
    qCInfo(lcCapture) << "Audio input activated:" << input_.description() << format.sampleRate() << "Hz";
    return DeviceResult::succeeded();
}

void QtAudioCaptureDevice::deactivate() {
    if (writer_.isOpen()) {
        const DeviceResult ended = endStream();
        if (!ended.success()) {
            qCWarning(lcCapture) << "Stream did not close cleanly on deactivate:" << ended.message;
        }
    }
    if (source_) {
        source_->disconnect(this);
        source_->stop();
        source_.reset();
        qCInfo(lcCapture) << "Audio input released";
    }
    suspended_ = false;
}

DeviceResult QtAudioCaptureDevice::beginStream(const QString& filePath) {
    if (!source_) {
        return DeviceResult::failed(DeviceFailure::NotActive, "Audio input is not active.");
    }
    if (writer_.isOpen()) {
        return DeviceResult::failed(DeviceFailure::AlreadyActive, "A capture stream is already running.");
    }

    const QAudioFormat format = source_->format();
    PcmFormat pcm;
    pcm.sampleRate = format.sampleRate();
    pcm.channelCount = format.channelCount();
    pcm.bitsPerSample = format.bytesPerSample() * 8;
    if (!writer_.open(filePath, pcm)) {
        return DeviceResult::failed(DeviceFailure::IoError, QString("Unable to create %1.").arg(filePath));
    }

    inputStream_ = source_->start();
    if (inputStream_.isNull() || source_->error() != QAudio::NoError) {
        writer_.close();
        return DeviceResult::failed(DeviceFailure::Unavailable, "Audio input failed to start.");
    }
    connect(inputStream_.data(), &QIODevice::readyRead, this, &QtAudioCaptureDevice::drainInput);
    lastPath_ = filePath;
    lastDurationMs_ = 0;
    return DeviceResult::succeeded();
}

DeviceResult QtAudioCaptureDevice::endStream() {
    if (!writer_.isOpen()) {
        return DeviceResult::failed(DeviceFailure::NotActive, "No capture stream is running.");
    }
    drainInput();
    if (!inputStream_.isNull()) {
        inputStream_->disconnect(this);
    }
    if (source_) {
        source_->stop();
    }
    inputStream_.clear();

    lastDurationMs_ = writer_.durationMs();
    if (!writer_.close()) {
        return DeviceResult::failed(DeviceFailure::IoError, QString("Unable to finalize %1.").arg(lastPath_));
    }
    return DeviceResult::succeeded();
}

CaptureStatus QtAudioCaptureDevice::status() const {
    CaptureStatus status;
    status.recording = writer_.isOpen();
    status.durationMs = writer_.isOpen() ? writer_.durationMs() : lastDurationMs_;
    status.path = lastPath_;
    return status;
}

void QtAudioCaptureDevice::drainInput() {
    if (inputStream_.isNull() || !writer_.isOpen()) {
        return;
    }
    const QByteArray chunk = inputStream_->readAll();
    if (!chunk.isEmpty() && !writer_.write(chunk)) {
        qCWarning(lcCapture) << "Dropped" << chunk.size() << "bytes of captured audio";
    }
}

void QtAudioCaptureDevice::onSourceStateChanged(int state) {
    if (!writer_.isOpen()) {
        return;
    }
    switch (static_cast<QAudio::State>(state)) {
    case QAudio::SuspendedState:
        suspended_ = true;
        emit interruptionBegan(InterruptionKind::Paused, "audio input suspended");
        break;
    case QAudio::ActiveState:
        if (suspended_) {
            suspended_ = false;
            emit interruptionEnded();
        }
        break;
    case QAudio::StoppedState:
        if (source_ && source_->error() != QAudio::NoError) {
            suspended_ = true;
            emit interruptionBegan(InterruptionKind::Interrupted, "audio input error");
        }
        break;
    case QAudio::IdleState:
        break;
    }
}

void QtAudioCaptureDevice::onInputsChanged() {
    if (!writer_.isOpen() || input_.isNull()) {
        return;
    }
    const auto inputs = QMediaDevices::audioInputs();
    for (const QAudioDevice& device : inputs) {
        if (device.id() == input_.id()) {
            if (suspended_) {
                suspended_ = false;
                emit interruptionEnded();
            }
            return;
        }
    }
    qCWarning(lcCapture) << "Audio input disappeared:" << input_.description();
    suspended_ = true;
    emit interruptionBegan(InterruptionKind::Interrupted, "audio input removed");
}

}  // namespace sacore
