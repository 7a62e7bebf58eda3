#include "sacore/storage_monitor.hpp"

#include <QStorageInfo>

#include "sacore/logging.hpp"
#include "sacore/telemetry.hpp"

namespace sacore {

VolumeFreeSpaceProbe::VolumeFreeSpaceProbe(QString path)
    : path_(std::move(path)) {}

std::optional<qint64> VolumeFreeSpaceProbe::freeBytes() const {
    const QStorageInfo info(path_);
    if (!info.isValid() || !info.isReady()) {
        qCWarning(lcStorage) << "Unable to determine free disk space for" << path_;
        return std::nullopt;
    }
    return info.bytesAvailable();
}

StorageMonitor::StorageMonitor(
    const FreeSpaceProbe* probe,
    qint64 warningThresholdBytes,
    qint64 criticalThresholdBytes,
    TelemetrySink* telemetry,
    QObject* parent)
    : QObject(parent),
      probe_(probe),
      warningThresholdBytes_(warningThresholdBytes),
      criticalThresholdBytes_(criticalThresholdBytes),
      telemetry_(telemetry) {
    status_ = evaluate(std::nullopt, warningThresholdBytes_, criticalThresholdBytes_);
    connect(&pollTimer_, &QTimer::timeout, this, [this]() { refresh(); });
}

StorageStatus StorageMonitor::evaluate(
    std::optional<qint64> freeBytes,
    qint64 warningThresholdBytes,
    qint64 criticalThresholdBytes) {
    StorageStatus status;
    status.freeBytes = freeBytes;
    status.warningThresholdBytes = warningThresholdBytes;
    status.criticalThresholdBytes = criticalThresholdBytes;
    if (freeBytes) {
        status.warning = *freeBytes < warningThresholdBytes;
        status.critical = *freeBytes < criticalThresholdBytes;
    }
    return status;
}

StorageStatus StorageMonitor::refresh() {
    const StorageStatus previous = status_;
    status_ = evaluate(probe_->freeBytes(), warningThresholdBytes_, criticalThresholdBytes_);

    const qint64 freeBytes = status_.freeBytes.value_or(-1);
    if (status_.warning && !previous.warning) {
        qCWarning(lcStorage) << "Free space below warning threshold:" << freeBytes << "bytes";
        reportTelemetry(
            telemetry_,
            "safety_audio_storage_threshold_crossed",
            {{"threshold", "warning"}, {"freeBytes", static_cast<double>(freeBytes)}});
        emit thresholdCrossed("warning", status_);
    }
    if (status_.critical && !previous.critical) {
        qCCritical(lcStorage) << "Free space below critical threshold:" << freeBytes << "bytes";
        reportTelemetry(
            telemetry_,
            "safety_audio_storage_threshold_crossed",
            {{"threshold", "critical"}, {"freeBytes", static_cast<double>(freeBytes)}});
        emit thresholdCrossed("critical", status_);
    }

    emit statusChanged(status_);
    return status_;
}

void StorageMonitor::startPolling(int intervalMs) {
    pollTimer_.start(intervalMs);
}

void StorageMonitor::stopPolling() {
    pollTimer_.stop();
}

}  // namespace sacore
