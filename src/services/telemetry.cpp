#include "sacore/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>

#include <exception>

#include "sacore/logging.hpp"

namespace sacore {

void reportTelemetry(TelemetrySink* sink, const QString& name, const QJsonObject& payload) {
    if (sink == nullptr) {
        return;
    }
    try {
        sink->track(name, payload);
    } catch (const std::exception& error) {
        qCWarning(lcController) << "Telemetry delivery failed for" << name << error.what();
    }
}

void reportDuration(TelemetrySink* sink, const QString& key, qint64 durationMs) {
    if (sink == nullptr) {
        return;
    }
    try {
        sink->recordDurationMs(key, durationMs);
    } catch (const std::exception& error) {
        qCWarning(lcController) << "Telemetry duration delivery failed for" << key << error.what();
    }
}

Telemetry::Telemetry(int maxEvents)
    : maxEvents_(qMax(1, maxEvents)) {}

void Telemetry::track(const QString& name, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    counters_[name] += 1;

    events_.enqueue(QJsonObject {
        {"name", name},
        {"at", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)},
        {"payload", payload},
    });
    while (events_.size() > maxEvents_) {
        events_.dequeue();
    }
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    DurationStats& stats = durations_[key];
    stats.minMs = stats.count == 0 ? durationMs : qMin(stats.minMs, durationMs);
    stats.maxMs = stats.count == 0 ? durationMs : qMax(stats.maxMs, durationMs);
    stats.totalMs += durationMs;
    ++stats.count;
}

qint64 Telemetry::counter(const QString& name) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(name, 0);
}

QJsonArray Telemetry::events() const {
    QMutexLocker lock(&mutex_);
    QJsonArray out;
    for (const QJsonObject& event : events_) {
        out.append(event);
    }
    return out;
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonObject counters;
    for (auto it = counters_.cbegin(); it != counters_.cend(); ++it) {
        counters.insert(it.key(), static_cast<double>(it.value()));
    }

    QJsonObject durations;
    for (auto it = durations_.cbegin(); it != durations_.cend(); ++it) {
        const DurationStats& stats = it.value();
        durations.insert(it.key(), QJsonObject {
            {"count", static_cast<double>(stats.count)},
            {"min_ms", static_cast<double>(stats.minMs)},
            {"max_ms", static_cast<double>(stats.maxMs)},
            {"avg_ms", static_cast<double>(stats.totalMs) / static_cast<double>(stats.count)},
        });
    }

    QJsonArray events;
    for (const QJsonObject& event : events_) {
        events.append(event);
    }

    return QJsonObject {
        {"generated_at", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs)},
        {"counters", counters},
        {"durations", durations},
        {"events", events},
    };
}

bool Telemetry::exportToFile(const QString& filePath, QString* error) const {
    const QByteArray body = QJsonDocument(snapshot()).toJson(QJsonDocument::Indented);

    if (!QDir().mkpath(QFileInfo(filePath).absolutePath())) {
        if (error != nullptr) {
            *error = QString("Unable to create the directory for %1.").arg(filePath);
        }
        return false;
    }
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly) || file.write(body) != body.size() || !file.commit()) {
        if (error != nullptr) {
            *error = QString("Unable to write %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    return true;
}

}  // namespace sacore
