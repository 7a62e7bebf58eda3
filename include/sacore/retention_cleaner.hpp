#pragma once

#include <QObject>
#include <QTimer>
#include <QVector>

#include "sacore/types.hpp"

namespace sacore {

class Clock;
class RecordingStore;
class TelemetrySink;

struct CleanupResult {
    int deletedExpiredCount = 0;
    int removedMissingCount = 0;
    QVector<Recording> remaining;
};

class RetentionCleaner final : public QObject {
    Q_OBJECT

public:
    RetentionCleaner(
        RecordingStore* store,
        const Clock* clock,
        TelemetrySink* telemetry = nullptr,
        QObject* parent = nullptr);

    CleanupResult runPass();
    CleanupResult runPass(qint64 nowMs);

    void startSchedule(int intervalMs);
    void stopSchedule();
    [[nodiscard]] bool isScheduled() const { return timer_.isActive(); }

signals:
    void passCompleted(int deletedExpiredCount, int removedMissingCount);

private:
    RecordingStore* store_;
    const Clock* clock_;
    TelemetrySink* telemetry_;
    QTimer timer_;
};

}  // namespace sacore
