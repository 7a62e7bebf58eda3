#pragma once

#include <QByteArray>
#include <QFile>
#include <QString>

#include <optional>

namespace sacore {

struct PcmFormat {
    int sampleRate = 16000;
    int channelCount = 1;
    int bitsPerSample = 16;

    [[nodiscard]] int bytesPerFrame() const { return channelCount * bitsPerSample / 8; }
    [[nodiscard]] int byteRate() const { return sampleRate * bytesPerFrame(); }
};

// Streams PCM into a RIFF/WAVE file. The header sizes are written as
// placeholders on open and patched on close, so an unclosed file still
// carries a valid format chunk.
class WavFileWriter {
public:
    WavFileWriter() = default;
    ~WavFileWriter();

    WavFileWriter(const WavFileWriter&) = delete;
    WavFileWriter& operator=(const WavFileWriter&) = delete;

    bool open(const QString& filePath, const PcmFormat& format);
    bool write(const QByteArray& pcm);
    bool close();

    [[nodiscard]] bool isOpen() const { return file_.isOpen(); }
    [[nodiscard]] QString filePath() const { return file_.fileName(); }
    [[nodiscard]] qint64 dataBytes() const { return dataBytes_; }
    [[nodiscard]] qint64 durationMs() const;
    [[nodiscard]] QString errorString() const { return file_.errorString(); }

    static constexpr qint64 kHeaderBytes = 44;

private:
    bool writeHeader(quint32 dataBytes);

    QFile file_;
    PcmFormat format_;
    qint64 dataBytes_ = 0;
};

// Duration implied by a WAV file's byte rate and its data size. Unfinalized
// files fall back to the file size. Returns nullopt when the file cannot be
// opened and 0 when the header is unusable.
std::optional<qint64> estimateWavDurationMs(const QString& filePath);

}  // namespace sacore
