#include "sacore/engine_config.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>

#include <climits>

namespace sacore {

namespace {

bool readPositive(const QJsonObject& object, const QString& key, qint64& out, QString* error) {
    if (!object.contains(key)) {
        return true;
    }
    const QJsonValue value = object.value(key);
    if (!value.isDouble() || value.toDouble() <= 0) {
        if (error != nullptr) {
            *error = QString("Config key %1 must be a positive number.").arg(key);
        }
        return false;
    }
    out = static_cast<qint64>(value.toDouble());
    return true;
}

bool readBool(const QJsonObject& object, const QString& key, bool& out, QString* error) {
    if (!object.contains(key)) {
        return true;
    }
    const QJsonValue value = object.value(key);
    if (!value.isBool()) {
        if (error != nullptr) {
            *error = QString("Config key %1 must be a boolean.").arg(key);
        }
        return false;
    }
    out = value.toBool();
    return true;
}

}  // namespace

QString EngineConfig::defaultRootDirectory() {
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        base = QDir::currentPath();
    }
    return QDir(base).filePath("safety-audio");
}

EngineConfig EngineConfig::defaults() {
    EngineConfig config;
    config.rootDirectory = defaultRootDirectory();
    return config;
}

EngineConfig EngineConfig::fromJson(const QJsonObject& object, const EngineConfig& base, QString* error) {
    EngineConfig config = base;
    if (object.contains("root_directory")) {
        const QString root = object.value("root_directory").toString().trimmed();
        if (root.isEmpty()) {
            if (error != nullptr) {
                *error = "Config key root_directory must be a non-empty string.";
            }
            return base;
        }
        config.rootDirectory = root;
    }

    qint64 storagePoll = config.storagePollIntervalMs;
    qint64 retentionInterval = config.retentionIntervalMs;
    if (!readPositive(object, "segment_duration_ms", config.segmentDurationMs, error)
        || !readPositive(object, "retention_window_ms", config.retentionWindowMs, error)
        || !readPositive(object, "warning_threshold_bytes", config.warningThresholdBytes, error)
        || !readPositive(object, "critical_threshold_bytes", config.criticalThresholdBytes, error)
        || !readPositive(object, "storage_poll_interval_ms", storagePoll, error)
        || !readPositive(object, "retention_interval_ms", retentionInterval, error)
        || !readBool(object, "auto_record_default", config.autoRecordDefault, error)
        || !readBool(object, "keep_alive", config.keepAliveEnabled, error)) {
        return base;
    }
    config.storagePollIntervalMs = static_cast<int>(qMin<qint64>(storagePoll, INT_MAX));
    config.retentionIntervalMs = static_cast<int>(qMin<qint64>(retentionInterval, INT_MAX));

    const QString invalid = config.validate();
    if (!invalid.isEmpty()) {
        if (error != nullptr) {
            *error = invalid;
        }
        return base;
    }
    return config;
}

QJsonObject EngineConfig::toJson() const {
    return {
        {"root_directory", rootDirectory},
        {"segment_duration_ms", static_cast<double>(segmentDurationMs)},
        {"retention_window_ms", static_cast<double>(retentionWindowMs)},
        {"warning_threshold_bytes", static_cast<double>(warningThresholdBytes)},
        {"critical_threshold_bytes", static_cast<double>(criticalThresholdBytes)},
        {"storage_poll_interval_ms", storagePollIntervalMs},
        {"retention_interval_ms", retentionIntervalMs},
        {"auto_record_default", autoRecordDefault},
        {"keep_alive", keepAliveEnabled},
    };
}

QString EngineConfig::validate() const {
    if (rootDirectory.trimmed().isEmpty()) {
        return "Recording root directory is not set.";
    }
    if (criticalThresholdBytes >= warningThresholdBytes) {
        return "critical_threshold_bytes must be lower than warning_threshold_bytes.";
    }
    return {};
}

ConfigLoadResult loadEngineConfig(const QString& filePath) {
    ConfigLoadResult result;
    result.path = filePath;
    result.config = EngineConfig::defaults();

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.error = "Failed to open config file.";
        return result;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        result.error = "Config file must contain a JSON object.";
        return result;
    }

    QString error;
    result.config = EngineConfig::fromJson(doc.object(), result.config, &error);
    if (!error.isEmpty()) {
        result.error = error;
        return result;
    }
    result.success = true;
    return result;
}

void applyEnvironmentOverrides(EngineConfig& config) {
    const QString root = qEnvironmentVariable("SAFETY_AUDIO_ROOT").trimmed();
    if (!root.isEmpty()) {
        config.rootDirectory = root;
    }
}

}  // namespace sacore
