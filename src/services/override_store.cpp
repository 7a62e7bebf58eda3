#include "sacore/override_store.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include "sacore/logging.hpp"

namespace sacore {

OverrideStore::OverrideStore(QSettings* settings)
    : settings_(settings) {}

QString OverrideStore::storageKey() {
    return QStringLiteral("safety_audio/overrides.v1");
}

OverrideMap OverrideStore::load() const {
    OverrideMap overrides;
    const QByteArray raw = settings_->value(storageKey()).toByteArray();
    if (raw.isEmpty()) {
        return overrides;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcController) << "Unable to restore safety audio overrides:" << parseError.errorString();
        return overrides;
    }

    const QJsonObject object = doc.object();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        const auto state = overrideStateFromString(it.value().toString());
        if (state && !it.key().trimmed().isEmpty()) {
            overrides.insert(it.key(), *state);
        }
    }
    return overrides;
}

bool OverrideStore::save(const OverrideMap& overrides) {
    QJsonObject object;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        object.insert(it.key(), toString(it.value()));
    }
    settings_->setValue(storageKey(), QJsonDocument(object).toJson(QJsonDocument::Compact));
    settings_->sync();
    if (settings_->status() != QSettings::NoError) {
        qCWarning(lcController) << "Unable to persist safety audio overrides to" << settings_->fileName();
        return false;
    }
    return true;
}

}  // namespace sacore
