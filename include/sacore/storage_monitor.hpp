#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include <optional>

#include "sacore/types.hpp"

namespace sacore {

class TelemetrySink;

class FreeSpaceProbe {
public:
    virtual ~FreeSpaceProbe() = default;

    // Remaining bytes on the recording volume, or nullopt when unknown.
    [[nodiscard]] virtual std::optional<qint64> freeBytes() const = 0;
};

class VolumeFreeSpaceProbe final : public FreeSpaceProbe {
public:
    explicit VolumeFreeSpaceProbe(QString path);

    [[nodiscard]] std::optional<qint64> freeBytes() const override;

private:
    QString path_;
};

// Storage admission control for the recorder. Warning and critical crossings
// are reported once per false -> true transition.
class StorageMonitor final : public QObject {
    Q_OBJECT

public:
    StorageMonitor(
        const FreeSpaceProbe* probe,
        qint64 warningThresholdBytes,
        qint64 criticalThresholdBytes,
        TelemetrySink* telemetry = nullptr,
        QObject* parent = nullptr);

    [[nodiscard]] StorageStatus status() const { return status_; }
    StorageStatus refresh();

    void startPolling(int intervalMs);
    void stopPolling();
    [[nodiscard]] bool isPolling() const { return pollTimer_.isActive(); }

    static StorageStatus evaluate(
        std::optional<qint64> freeBytes,
        qint64 warningThresholdBytes,
        qint64 criticalThresholdBytes);

signals:
    void statusChanged(const sacore::StorageStatus& status);
    void thresholdCrossed(const QString& threshold, const sacore::StorageStatus& status);

private:
    const FreeSpaceProbe* probe_;
    qint64 warningThresholdBytes_;
    qint64 criticalThresholdBytes_;
    TelemetrySink* telemetry_;
    StorageStatus status_;
    QTimer pollTimer_;
};

}  // namespace sacore
