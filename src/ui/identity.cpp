#include "ui/identity.hpp"

#include <QDebug>

namespace sketchsync::ui {

ActorId load_or_create_actor_id(QSettings& settings) {
    const QString key = QString::fromLatin1(SETTINGS_ACTOR_ID);
    const QString stored = settings.value(key).toString().trimmed();
    if (!stored.isEmpty()) {
        return stored.toStdString();
    }

    const auto id = Uuid::generate().to_string();
    settings.setValue(key, QString::fromStdString(id));
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qWarning() << "Identity: could not persist actor id, it will change on next start";
    }
    qInfo() << "Identity: created actor id" << QString::fromStdString(id);
    return id;
}

} // namespace sketchsync::ui
