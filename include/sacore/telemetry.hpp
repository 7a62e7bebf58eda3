#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QQueue>
#include <QString>

namespace sacore {

// Fire-and-forget sink for named engine events.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void track(const QString& name, const QJsonObject& payload = {}) = 0;
    virtual void recordDurationMs(const QString& key, qint64 durationMs) {
        Q_UNUSED(key);
        Q_UNUSED(durationMs);
    }
};

// Delivers to |sink| and logs instead of propagating a sink failure.
void reportTelemetry(TelemetrySink* sink, const QString& name, const QJsonObject& payload = {});
void reportDuration(TelemetrySink* sink, const QString& key, qint64 durationMs);

// In-process sink: per-name event counters, duration stats and the most
// recent events. Safe to call from any thread.
class Telemetry final : public TelemetrySink {
public:
    explicit Telemetry(int maxEvents = 1500);

    void track(const QString& name, const QJsonObject& payload = {}) override;
    void recordDurationMs(const QString& key, qint64 durationMs) override;

    // Number of tracked events called |name|.
    [[nodiscard]] qint64 counter(const QString& name) const;
    [[nodiscard]] QJsonArray events() const;
    [[nodiscard]] QJsonObject snapshot() const;

    bool exportToFile(const QString& filePath, QString* error = nullptr) const;

private:
    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 minMs = 0;
        qint64 maxMs = 0;
    };

    mutable QMutex mutex_;
    QHash<QString, qint64> counters_;
    QHash<QString, DurationStats> durations_;
    QQueue<QJsonObject> events_;
    int maxEvents_;
};

}  // namespace sacore
