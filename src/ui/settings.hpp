#pragma once

#include "network/reconnect_policy.hpp"
#include <QSettings>
#include <QString>
#include <QUrl>
#include <chrono>

namespace sketchsync::ui {

/**
 * AppSettings - Runtime configuration.
 *
 * Read from QSettings, then overridden by SKETCHSYNC_ENDPOINT,
 * SKETCHSYNC_DB_PATH and SKETCHSYNC_DEBUG_SYNC.
 */
struct AppSettings {
    QUrl endpoint;
    network::ReconnectPolicy reconnect;
    std::chrono::milliseconds heartbeat_interval{1000};
    QString database_path;
    bool debug_sync = false;
};

[[nodiscard]] AppSettings load_app_settings(QSettings& settings);

/**
 * SKETCHSYNC_DB_PATH if set, otherwise sketchsync.db in AppDataLocation.
 * Creates the parent directory.
 */
[[nodiscard]] QString resolve_database_path();

} // namespace sketchsync::ui
