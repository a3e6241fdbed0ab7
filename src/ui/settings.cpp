#include "ui/settings.hpp"
#include "network/transport.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace sketchsync::ui {

namespace {

constexpr const char* kSettingsEndpoint = "sync/endpoint";
constexpr const char* kSettingsReconnectDelay = "sync/reconnect_delay_ms";
constexpr const char* kSettingsReconnectMultiplier = "sync/reconnect_multiplier";
constexpr const char* kSettingsReconnectMaxDelay = "sync/reconnect_max_delay_ms";
constexpr const char* kSettingsReconnectMaxAttempts = "sync/reconnect_max_attempts";
constexpr const char* kSettingsHeartbeat = "presence/heartbeat_ms";

QUrl parse_endpoint(const QString& value) {
    const QUrl url(value.trimmed());
    if (!url.isValid() || (url.scheme() != QStringLiteral("ws") && url.scheme() != QStringLiteral("wss"))) {
        qWarning() << "Settings: ignoring invalid endpoint" << value;
        return QUrl(QString::fromLatin1(network::DEFAULT_ENDPOINT));
    }
    return url;
}

int read_int(QSettings& settings, const char* key, int fallback) {
    bool ok = false;
    const int value = settings.value(QString::fromLatin1(key), fallback).toInt(&ok);
    return ok ? value : fallback;
}

} // namespace

AppSettings load_app_settings(QSettings& settings) {
    AppSettings out;

    out.endpoint = parse_endpoint(
        settings.value(QString::fromLatin1(kSettingsEndpoint),
                       QString::fromLatin1(network::DEFAULT_ENDPOINT)).toString());

    const network::ReconnectPolicy defaults;
    const int delay_ms = read_int(settings, kSettingsReconnectDelay,
                                  static_cast<int>(defaults.initial_delay.count()));
    out.reconnect.initial_delay = std::chrono::milliseconds(delay_ms >= 0 ? delay_ms : defaults.initial_delay.count());

    bool ok = false;
    const double multiplier = settings.value(QString::fromLatin1(kSettingsReconnectMultiplier),
                                             defaults.multiplier).toDouble(&ok);
    out.reconnect.multiplier = ok && multiplier >= 1.0 ? multiplier : defaults.multiplier;

    const int max_delay_ms = read_int(settings, kSettingsReconnectMaxDelay,
                                      static_cast<int>(defaults.max_delay.count()));
    out.reconnect.max_delay = std::chrono::milliseconds(max_delay_ms >= 0 ? max_delay_ms : defaults.max_delay.count());

    const int max_attempts = read_int(settings, kSettingsReconnectMaxAttempts, defaults.max_attempts);
    out.reconnect.max_attempts = max_attempts >= 0 ? max_attempts : defaults.max_attempts;

    const int heartbeat_ms = read_int(settings, kSettingsHeartbeat, 1000);
    out.heartbeat_interval = std::chrono::milliseconds(heartbeat_ms > 0 ? heartbeat_ms : 1000);

    const auto endpoint_override = qEnvironmentVariable("SKETCHSYNC_ENDPOINT");
    if (!endpoint_override.isEmpty()) {
        out.endpoint = parse_endpoint(endpoint_override);
    }

    out.database_path = resolve_database_path();
    out.debug_sync = qEnvironmentVariableIsSet("SKETCHSYNC_DEBUG_SYNC");
    return out;
}

QString resolve_database_path() {
    const auto overridePath = qEnvironmentVariable("SKETCHSYNC_DB_PATH");
    if (!overridePath.isEmpty()) {
        QFileInfo info(overridePath);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dir.filePath(QStringLiteral("sketchsync.db"));
}

} // namespace sketchsync::ui
