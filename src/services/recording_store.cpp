#include "sacore/recording_store.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRandomGenerator>
#include <QSaveFile>
#include <QSet>

#include <algorithm>

#include "sacore/logging.hpp"

namespace sacore {

RecordingStore::RecordingStore(QString rootDirectory, qint64 retentionWindowMs)
    : rootDirectory_(QDir::cleanPath(QDir(rootDirectory).absolutePath())),
      retentionWindowMs_(retentionWindowMs) {}

QString RecordingStore::captureExtension() {
    return QStringLiteral("wav");
}

QString RecordingStore::indexPath() const {
    return QDir(rootDirectory_).filePath("index.json");
}

qint64 RecordingStore::computeExpiryMs(qint64 createdAtMs) const {
    return createdAtMs + retentionWindowMs_;
}

QString RecordingStore::normalizePath(const QString& path) {
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

bool RecordingStore::ensureRootDirectory() const {
    QDir dir(rootDirectory_);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(".")) {
        qCCritical(lcStorage) << "Unable to create recording root" << rootDirectory_;
        return false;
    }
    return true;
}

QString RecordingStore::ensureSessionDirectory(const QString& sessionId) const {
    if (!ensureRootDirectory()) {
        return {};
    }
    const QString normalized = sessionId.trimmed().isEmpty() ? QString("default") : sessionId.trimmed();
    QDir root(rootDirectory_);
    if (!root.exists(normalized) && !root.mkpath(normalized)) {
        qCCritical(lcStorage) << "Unable to create session directory" << normalized;
        return {};
    }
    return root.filePath(normalized);
}

QString RecordingStore::generateRecordingId(qint64 nowMs) {
    return QString("safety-audio-%1-%2").arg(nowMs).arg(QRandomGenerator::global()->bounded(1000000));
}

std::optional<SegmentTarget> RecordingStore::allocateSegment(
    const QString& sessionId,
    qint64 createdAtMs) const {
    const QString sessionDirectory = ensureSessionDirectory(sessionId);
    if (sessionDirectory.isEmpty()) {
        return std::nullopt;
    }

    SegmentTarget target;
    target.sessionId = sessionId;
    target.createdAtMs = createdAtMs;
    target.recordingId = generateRecordingId(createdAtMs);
    QString safeTimestamp = isoTimestamp(createdAtMs);
    safeTimestamp.replace(':', '-').replace('.', '-');
    target.path = QDir(sessionDirectory)
                      .filePath(QString("%1-%2.%3").arg(safeTimestamp, target.recordingId, captureExtension()));
    return target;
}

std::optional<Recording> RecordingStore::persistSegment(
    const SegmentTarget& target,
    qint64 durationMs,
    const ContextDescriptor& descriptor) {
    const QFileInfo info(target.path);
    if (!info.exists()) {
        qCWarning(lcStorage) << "Segment file is missing at persist time:" << target.path;
        return std::nullopt;
    }

    Recording recording;
    recording.id = target.recordingId;
    recording.sessionId = target.sessionId;
    recording.path = normalizePath(target.path);
    recording.createdAtMs = target.createdAtMs;
    recording.expiresAtMs = computeExpiryMs(target.createdAtMs);
    recording.durationMs = qMax<qint64>(0, durationMs);
    recording.sizeBytes = info.size();
    recording.contextType = descriptor.contextType;
    recording.contextId = descriptor.contextId;
    recording.source = descriptor.source;

    if (!addRecording(recording)) {
        return std::nullopt;
    }
    return recording;
}

void RecordingStore::loadIndex() {
    if (loaded_) {
        return;
    }
    loaded_ = true;
    recordings_.clear();

    QFile file(indexPath());
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStorage) << "Unable to read recording index" << indexPath();
        return;
    }
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    file.close();
    if (!doc.isArray()) {
        qCWarning(lcStorage) << "Recording index is not a JSON array, starting empty";
        return;
    }

    for (const QJsonValue& value : doc.array()) {
        const auto recording = recordingFromJson(value.toObject());
        if (recording) {
            recordings_.append(*recording);
        }
    }
    sortRecordings();
}

bool RecordingStore::writeIndex() {
    if (!ensureRootDirectory()) {
        return false;
    }
    sortRecordings();
    QJsonArray rows;
    for (const Recording& recording : recordings_) {
        rows.append(toJson(recording));
    }

    QSaveFile file(indexPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCCritical(lcStorage) << "Unable to open recording index for writing" << indexPath();
        return false;
    }
    file.write(QJsonDocument(rows).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCCritical(lcStorage) << "Unable to commit recording index" << file.errorString();
        return false;
    }
    return true;
}

void RecordingStore::sortRecordings() {
    std::stable_sort(recordings_.begin(), recordings_.end(), [](const Recording& left, const Recording& right) {
        return left.createdAtMs > right.createdAtMs;
    });
}

QVector<Recording> RecordingStore::list() {
    loadIndex();
    return recordings_;
}

std::optional<Recording> RecordingStore::find(const QString& recordingId) {
    loadIndex();
    for (const Recording& recording : recordings_) {
        if (recording.id == recordingId) {
            return recording;
        }
    }
    return std::nullopt;
}

bool RecordingStore::containsPath(const QString& path) {
    loadIndex();
    const QString normalized = normalizePath(path);
    return std::any_of(recordings_.cbegin(), recordings_.cend(), [&normalized](const Recording& recording) {
        return normalizePath(recording.path) == normalized;
    });
}

bool RecordingStore::addRecording(const Recording& recording) {
    loadIndex();
    const QVector<Recording> previous = recordings_;
    recordings_.erase(
        std::remove_if(recordings_.begin(), recordings_.end(), [&recording](const Recording& item) {
            return item.id == recording.id;
        }),
        recordings_.end());
    recordings_.prepend(recording);
    if (!writeIndex()) {
        recordings_ = previous;
        return false;
    }
    return true;
}

bool RecordingStore::removeRecording(const QString& recordingId, bool deleteFile) {
    return removeRecordings({recordingId}, deleteFile);
}

bool RecordingStore::removeRecordings(const QStringList& recordingIds, bool deleteFiles) {
    loadIndex();
    if (recordingIds.isEmpty()) {
        return true;
    }

    const QSet<QString> targetIds(recordingIds.cbegin(), recordingIds.cend());
    QVector<Recording> removed;
    QVector<Recording> remaining;
    for (const Recording& recording : recordings_) {
        if (targetIds.contains(recording.id)) {
            removed.append(recording);
        } else {
            remaining.append(recording);
        }
    }

    const QVector<Recording> previous = recordings_;
    recordings_ = remaining;
    if (!writeIndex()) {
        recordings_ = previous;
        return false;
    }

    if (deleteFiles) {
        for (const Recording& recording : removed) {
            RecordingStore::deleteFile(recording.path);
        }
    }
    return true;
}

int RecordingStore::removeMissingFiles() {
    loadIndex();
    QStringList missingIds;
    for (const Recording& recording : recordings_) {
        if (!QFileInfo::exists(recording.path)) {
            missingIds.append(recording.id);
        }
    }
    if (missingIds.isEmpty()) {
        return 0;
    }
    if (!removeRecordings(missingIds, false)) {
        return 0;
    }
    return missingIds.size();
}

bool RecordingStore::clearAll() {
    loadIndex();
    QStringList ids;
    for (const Recording& recording : recordings_) {
        deleteFile(recording.path);
        ids.append(recording.id);
    }
    return removeRecordings(ids, false);
}

QStringList RecordingStore::captureFiles() const {
    QStringList files;
    if (!QDir(rootDirectory_).exists()) {
        return files;
    }
    QDirIterator it(
        rootDirectory_,
        {"*." + captureExtension()},
        QDir::Files | QDir::NoDotAndDotDot,
        QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.append(normalizePath(it.next()));
    }
    files.sort();
    return files;
}

bool RecordingStore::deleteFile(const QString& path) {
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        return true;
    }
    if (!QFile::remove(path)) {
        qCWarning(lcStorage) << "Unable to delete local safety audio file" << path;
        return false;
    }
    return true;
}

}  // namespace sacore
