#include "sacore/retention_cleaner.hpp"

#include "sacore/clock.hpp"
#include "sacore/logging.hpp"
#include "sacore/recording_store.hpp"
#include "sacore/telemetry.hpp"

namespace sacore {

RetentionCleaner::RetentionCleaner(
    RecordingStore* store,
    const Clock* clock,
    TelemetrySink* telemetry,
    QObject* parent)
    : QObject(parent),
      store_(store),
      clock_(clock),
      telemetry_(telemetry) {
    connect(&timer_, &QTimer::timeout, this, [this]() { runPass(); });
}

CleanupResult RetentionCleaner::runPass() {
    return runPass(clock_->nowMs());
}

CleanupResult RetentionCleaner::runPass(qint64 nowMs) {
    CleanupResult result;

    QStringList expiredIds;
    for (const Recording& recording : store_->list()) {
        if (recording.isExpired(nowMs)) {
            expiredIds.append(recording.id);
        }
    }
    if (!expiredIds.isEmpty()) {
        if (store_->removeRecordings(expiredIds, true)) {
            result.deletedExpiredCount = expiredIds.size();
        } else {
            qCWarning(lcRetention) << "Unable to remove" << expiredIds.size() << "expired recordings";
        }
    }

    result.removedMissingCount = store_->removeMissingFiles();
    result.remaining = store_->list();

    if (result.deletedExpiredCount > 0 || result.removedMissingCount > 0) {
        qCInfo(lcRetention) << "Retention pass deleted" << result.deletedExpiredCount << "expired and pruned"
                            << result.removedMissingCount << "missing recordings";
    }
    reportTelemetry(
        telemetry_,
        "safety_audio_cleanup_run",
        {{"deletedExpiredCount", result.deletedExpiredCount},
         {"removedMissingCount", result.removedMissingCount},
         {"remainingCount", result.remaining.size()}});
    emit passCompleted(result.deletedExpiredCount, result.removedMissingCount);
    return result;
}

void RetentionCleaner::startSchedule(int intervalMs) {
    timer_.start(intervalMs);
}

void RetentionCleaner::stopSchedule() {
    timer_.stop();
}

}  // namespace sacore
