#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "sacore/types.hpp"

namespace sacore {

// Where a segment is captured before it is indexed.
struct SegmentTarget {
    QString recordingId;
    QString sessionId;
    QString path;
    qint64 createdAtMs = 0;
};

// Owns the recording root directory and the recording index stored beside it.
// Index rows are kept sorted newest first and rewritten on every mutation.
class RecordingStore {
public:
    RecordingStore(QString rootDirectory, qint64 retentionWindowMs);

    static QString captureExtension();
    static QString generateRecordingId(qint64 nowMs);

    [[nodiscard]] QString rootDirectory() const { return rootDirectory_; }
    [[nodiscard]] QString indexPath() const;
    [[nodiscard]] qint64 retentionWindowMs() const { return retentionWindowMs_; }
    [[nodiscard]] qint64 computeExpiryMs(qint64 createdAtMs) const;

    bool ensureRootDirectory() const;
    QString ensureSessionDirectory(const QString& sessionId) const;
    std::optional<SegmentTarget> allocateSegment(const QString& sessionId, qint64 createdAtMs) const;

    std::optional<Recording> persistSegment(
        const SegmentTarget& target,
        qint64 durationMs,
        const ContextDescriptor& descriptor);

    QVector<Recording> list();
    std::optional<Recording> find(const QString& recordingId);
    bool containsPath(const QString& path);
    bool addRecording(const Recording& recording);
    bool removeRecording(const QString& recordingId, bool deleteFile = true);
    bool removeRecordings(const QStringList& recordingIds, bool deleteFiles = true);
    int removeMissingFiles();
    bool clearAll();

    // Capture files under the root, recursively, as absolute paths.
    [[nodiscard]] QStringList captureFiles() const;

    static bool deleteFile(const QString& path);
    static QString normalizePath(const QString& path);

private:
    void loadIndex();
    bool writeIndex();
    void sortRecordings();

    QString rootDirectory_;
    qint64 retentionWindowMs_;
    QVector<Recording> recordings_;
    bool loaded_ = false;
};

}  // namespace sacore
