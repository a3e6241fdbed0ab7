#include <catch2/catch_test_macros.hpp>

#include "ui/identity.hpp"

#include <QRegularExpression>
#include <QSettings>
#include <QTemporaryDir>

using namespace sketchsync;

namespace {

QString settingsPath(const QTemporaryDir& dir) {
    return dir.filePath(QStringLiteral("identity.ini"));
}

} // namespace

TEST_CASE("Identity: a new actor id is generated and persisted", "[identity]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    ActorId first;
    {
        QSettings settings(settingsPath(dir), QSettings::IniFormat);
        first = ui::load_or_create_actor_id(settings);
    }

    static const QRegularExpression uuid(
        QStringLiteral("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"));
    REQUIRE(uuid.match(QString::fromStdString(first)).hasMatch());

    QSettings reopened(settingsPath(dir), QSettings::IniFormat);
    REQUIRE(reopened.value(QString::fromLatin1(ui::SETTINGS_ACTOR_ID)).toString().toStdString() == first);
    REQUIRE(ui::load_or_create_actor_id(reopened) == first);
}

TEST_CASE("Identity: a stored id is reused as is", "[identity]") {
    QTemporaryDir dir;
    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    settings.setValue(QString::fromLatin1(ui::SETTINGS_ACTOR_ID), QStringLiteral("  custom-actor  "));

    REQUIRE(ui::load_or_create_actor_id(settings) == "custom-actor");
}

TEST_CASE("Identity: a blank stored id is replaced", "[identity]") {
    QTemporaryDir dir;
    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    settings.setValue(QString::fromLatin1(ui::SETTINGS_ACTOR_ID), QStringLiteral("   "));

    const auto id = ui::load_or_create_actor_id(settings);

    REQUIRE(id.size() == 36);
    REQUIRE(settings.value(QString::fromLatin1(ui::SETTINGS_ACTOR_ID)).toString().toStdString() == id);
}

TEST_CASE("Identity: separate installs get different ids", "[identity]") {
    QTemporaryDir dirA;
    QTemporaryDir dirB;
    QSettings a(settingsPath(dirA), QSettings::IniFormat);
    QSettings b(settingsPath(dirB), QSettings::IniFormat);

    REQUIRE(ui::load_or_create_actor_id(a) != ui::load_or_create_actor_id(b));
}
