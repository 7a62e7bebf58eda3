#include "sacore/orphan_recovery.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "sacore/logging.hpp"
#include "sacore/recorder_events.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/telemetry.hpp"
#include "sacore/wav_file.hpp"

namespace sacore {

OrphanRecovery::OrphanRecovery(RecordingStore* store, EventChannel* events, TelemetrySink* telemetry)
    : store_(store),
      events_(events),
      telemetry_(telemetry) {}

Recording OrphanRecovery::recordingForOrphan(
    const QString& filePath,
    qint64 durationMs,
    qint64 retentionWindowMs) {
    const QFileInfo info(filePath);
    QDateTime created = info.birthTime();
    if (!created.isValid()) {
        created = info.lastModified();
    }
    const qint64 createdAtMs = created.isValid() ? created.toMSecsSinceEpoch() : QDateTime::currentMSecsSinceEpoch();

    Recording recording;
    recording.id = RecordingStore::generateRecordingId(createdAtMs);
    recording.sessionId = info.dir().dirName();
    recording.path = RecordingStore::normalizePath(filePath);
    recording.createdAtMs = createdAtMs;
    recording.expiresAtMs = createdAtMs + retentionWindowMs;
    recording.durationMs = qMax<qint64>(0, durationMs);
    recording.sizeBytes = info.size();
    recording.contextType = ContextType::Manual;
    recording.source = RecordingSource::Restarted;
    return recording;
}

RecoveryReport OrphanRecovery::run() {
    RecoveryReport report;

    QSet<QString> indexed;
    for (const Recording& recording : store_->list()) {
        indexed.insert(RecordingStore::normalizePath(recording.path));
    }

    const QStringList files = store_->captureFiles();
    report.scannedFiles = files.size();
    const qint64 retentionWindowMs = store_->retentionWindowMs();

    for (const QString& filePath : files) {
        if (indexed.contains(filePath)) {
            continue;
        }
        const auto durationMs = estimateWavDurationMs(filePath);
        if (!durationMs) {
            qCWarning(lcRecovery) << "Skipping unreadable capture file" << filePath;
            ++report.skippedFiles;
            continue;
        }

        const Recording recording = recordingForOrphan(filePath, *durationMs, retentionWindowMs);
        if (!store_->addRecording(recording)) {
            qCWarning(lcRecovery) << "Unable to index recovered capture file" << filePath;
            ++report.skippedFiles;
            continue;
        }
        indexed.insert(filePath);
        report.recovered.append(recording);
        qCInfo(lcRecovery) << "Recovered orphaned segment" << filePath << *durationMs << "ms";
        if (events_ != nullptr) {
            events_->publish(RecoveredEvent {recording});
        }
    }

    if (report.skippedFiles > 0) {
        report.error = EngineError {
            ErrorCode::RecoveryPartial,
            QString("%1 capture file(s) could not be recovered.").arg(report.skippedFiles),
        };
    }
    if (!report.recovered.isEmpty() || report.error) {
        reportTelemetry(
            telemetry_,
            "safety_audio_recovery_run",
            {{"recoveredCount", report.recovered.size()}, {"skippedCount", report.skippedFiles}});
    }
    return report;
}

}  // namespace sacore
