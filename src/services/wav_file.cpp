#include "sacore/wav_file.hpp"

#include <QtEndian>

#include "sacore/logging.hpp"

namespace sacore {

namespace {

void appendLe32(QByteArray& out, quint32 value) {
    char bytes[4];
    qToLittleEndian(value, bytes);
    out.append(bytes, 4);
}

void appendLe16(QByteArray& out, quint16 value) {
    char bytes[2];
    qToLittleEndian(value, bytes);
    out.append(bytes, 2);
}

quint32 readLe32(const QByteArray& data, int offset) {
    return qFromLittleEndian<quint32>(data.constData() + offset);
}

quint16 readLe16(const QByteArray& data, int offset) {
    return qFromLittleEndian<quint16>(data.constData() + offset);
}

}  // namespace

WavFileWriter::~WavFileWriter() {
    if (file_.isOpen()) {
        close();
    }
}

bool WavFileWriter::open(const QString& filePath, const PcmFormat& format) {
    if (file_.isOpen()) {
        return false;
    }
    format_ = format;
    dataBytes_ = 0;
    file_.setFileName(filePath);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcCapture) << "Unable to open capture file" << filePath << file_.errorString();
        return false;
    }
    if (!writeHeader(0)) {
        file_.close();
        return false;
    }
    return true;
}

bool WavFileWriter::write(const QByteArray& pcm) {
    if (!file_.isOpen()) {
        return false;
    }
    const qint64 written = file_.write(pcm);
    if (written != pcm.size()) {
        qCWarning(lcCapture) << "Short write to capture file" << file_.fileName() << file_.errorString();
        if (written > 0) {
            dataBytes_ += written;
        }
        return false;
    }
    dataBytes_ += written;
    return true;
}

bool WavFileWriter::close() {
    if (!file_.isOpen()) {
        return false;
    }
    const bool patched = file_.seek(0) && writeHeader(static_cast<quint32>(qMin<qint64>(dataBytes_, 0xFFFFFFFFLL - 36)));
    const bool flushed = file_.flush();
    file_.close();
    if (!patched || !flushed) {
        qCWarning(lcCapture) << "Unable to finalize capture file header" << file_.fileName();
        return false;
    }
    return true;
}

qint64 WavFileWriter::durationMs() const {
    const int byteRate = format_.byteRate();
    if (byteRate <= 0) {
        return 0;
    }
    return dataBytes_ * 1000 / byteRate;
}

bool WavFileWriter::writeHeader(quint32 dataBytes) {
    QByteArray header;
    header.reserve(static_cast<int>(kHeaderBytes));
    header.append("RIFF", 4);
    appendLe32(header, 36 + dataBytes);
    header.append("WAVE", 4);
    header.append("fmt ", 4);
    appendLe32(header, 16);
    appendLe16(header, 1);
    appendLe16(header, static_cast<quint16>(format_.channelCount));
    appendLe32(header, static_cast<quint32>(format_.sampleRate));
    appendLe32(header, static_cast<quint32>(format_.byteRate()));
    appendLe16(header, static_cast<quint16>(format_.bytesPerFrame()));
    appendLe16(header, static_cast<quint16>(format_.bitsPerSample));
    header.append("data", 4);
    appendLe32(header, dataBytes);
    return file_.write(header) == header.size();
}

std::optional<qint64> estimateWavDurationMs(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const qint64 fileSize = file.size();
    const QByteArray head = file.read(4096);
    file.close();

    if (head.size() < 12 || !head.startsWith("RIFF") || head.mid(8, 4) != "WAVE") {
        return 0;
    }

    quint32 byteRate = 0;
    int offset = 12;
    while (offset + 8 <= head.size()) {
        const QByteArray chunkId = head.mid(offset, 4);
        const quint32 chunkSize = readLe32(head, offset + 4);
        const int body = offset + 8;
        if (chunkId == "fmt " && body + 16 <= head.size()) {
            byteRate = readLe32(head, body + 8);
            if (readLe16(head, body) != 1) {
                return 0;
            }
        } else if (chunkId == "data") {
            if (byteRate == 0) {
                return 0;
            }
            const qint64 available = qMax<qint64>(0, fileSize - body);
            qint64 dataBytes = chunkSize;
            if (dataBytes == 0 || dataBytes > available) {
                dataBytes = available;
            }
            return dataBytes * 1000 / byteRate;
        }
        const qint64 next = static_cast<qint64>(body) + chunkSize + (chunkSize & 1U);
        if (next > head.size()) {
            break;
        }
        offset = static_cast<int>(next);
    }
    return 0;
}

}  // namespace sacore
