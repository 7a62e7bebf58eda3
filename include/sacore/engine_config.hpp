#pragma once

#include <QJsonObject>
#include <QString>

namespace sacore {

struct EngineConfig {
    QString rootDirectory;
    qint64 segmentDurationMs = 5 * 60 * 1000;
    qint64 retentionWindowMs = 7LL * 24 * 60 * 60 * 1000;
    qint64 warningThresholdBytes = 500LL * 1024 * 1024;
    qint64 criticalThresholdBytes = 200LL * 1024 * 1024;
    int storagePollIntervalMs = 60 * 1000;
    int retentionIntervalMs = 6 * 60 * 60 * 1000;
    bool autoRecordDefault = false;
    bool keepAliveEnabled = false;

    static QString defaultRootDirectory();
    static EngineConfig defaults();

    // Applies known keys from |object| on top of |base|. Unknown keys are ignored.
    static EngineConfig fromJson(const QJsonObject& object, const EngineConfig& base, QString* error = nullptr);

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] QString validate() const;
};

struct ConfigLoadResult {
    bool success = false;
    EngineConfig config;
    QString error;
    QString path;
};

ConfigLoadResult loadEngineConfig(const QString& filePath);

// SAFETY_AUDIO_ROOT overrides the configured root directory when set.
void applyEnvironmentOverrides(EngineConfig& config);

}  // namespace sacore
