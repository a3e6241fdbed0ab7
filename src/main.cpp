#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QSettings>
#include <QTextStream>

#include "core/replica_store.hpp"
#include "network/sync_session.hpp"
#include "network/transport.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/replica_repository.hpp"
#include "ui/cli/show_document.hpp"
#include "ui/controllers/SketchController.hpp"
#include "ui/identity.hpp"
#include "ui/logging.hpp"
#include "ui/settings.hpp"

namespace {

using namespace sketchsync;

void print_error(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
}

void print_error(const Error& error) {
    print_error(QString::fromStdString(error.message));
}

Result<storage::Database, Error> open_database(const QString& path) {
    auto db_result = storage::Database::open(path.toStdString());
    if (db_result.is_err()) {
        return db_result;
    }
    auto db = std::move(db_result).unwrap();
    auto migrated = storage::initialize_database(db);
    if (migrated.is_err()) {
        return Result<storage::Database, Error>::err(migrated.unwrap_err());
    }
    return Result<storage::Database, Error>::ok(std::move(db));
}

// Restore the persisted replica, if any. A corrupt snapshot is reported and
// the fresh replica is kept.
void restore_replica(store::ReplicaStore& store, storage::ReplicaRepository& repo) {
    auto loaded = repo.load_snapshot(storage::ReplicaRepository::DEFAULT_DOC_KEY);
    if (loaded.is_err()) {
        qWarning() << "SketchSync: could not read saved replica:"
                   << QString::fromStdString(loaded.unwrap_err().message);
        return;
    }
    const auto& snapshot = loaded.unwrap();
    if (!snapshot) {
        return;
    }
    if (snapshot->actor_id != store.actor()) {
        qWarning() << "SketchSync: saved replica belongs to actor"
                   << QString::fromStdString(snapshot->actor_id) << "- loading it anyway";
    }
    auto restored = store.load(snapshot->snapshot);
    if (restored.is_err()) {
        qWarning() << "SketchSync: discarding unreadable saved replica:"
                   << QString::fromStdString(restored.unwrap_err().message);
    }
}

Result<void, Error> persist_replica(const store::ReplicaStore& store, storage::ReplicaRepository& repo) {
    return repo.save_snapshot(storage::ReplicaSnapshot{
        .doc_key = storage::ReplicaRepository::DEFAULT_DOC_KEY,
        .snapshot = store.save(),
        .actor_id = store.actor(),
        .updated_at = Timestamp::now()
    });
}

int finish_edit(const Result<void, Error>& edited,
                const store::ReplicaStore& store,
                storage::ReplicaRepository& repo) {
    if (edited.is_err()) {
        print_error(edited.unwrap_err());
        return 1;
    }
    auto saved = persist_replica(store, repo);
    if (saved.is_err()) {
        print_error(saved.unwrap_err());
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("SketchSync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("SketchSync");
    app.setOrganizationDomain("sketchsync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("SketchSync replica"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets SKETCHSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption endpointOption(
        QStringList{QStringLiteral("endpoint")},
        QStringLiteral("Relay endpoint (sets SKETCHSYNC_ENDPOINT for this run)."),
        QStringLiteral("url"));
    parser.addOption(endpointOption);

    const QCommandLineOption maxRetriesOption(
        QStringList{QStringLiteral("max-retries")},
        QStringLiteral("Give up after this many reconnect attempts (0 = never)."),
        QStringLiteral("count"));
    parser.addOption(maxRetriesOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for 'show')."));
    parser.addOption(jsonOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include element IDs in 'show' output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets SKETCHSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("run (default), show, title <text>, note <text>, reset."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("SKETCHSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(endpointOption)) {
        qputenv("SKETCHSYNC_ENDPOINT", parser.value(endpointOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("SKETCHSYNC_DEBUG_SYNC", "1");
    }

    QSettings settings;
    const auto actor = ui::load_or_create_actor_id(settings);
    auto config = ui::load_app_settings(settings);
    ui::set_sync_debug_logging(config.debug_sync);

    if (parser.isSet(maxRetriesOption)) {
        bool ok = false;
        const int retries = parser.value(maxRetriesOption).toInt(&ok);
        if (!ok || retries < 0) {
            print_error(QStringLiteral("--max-retries expects a non-negative number"));
            return 1;
        }
        config.reconnect.max_attempts = retries;
    }

    auto db_result = open_database(config.database_path);
    if (db_result.is_err()) {
        print_error(QStringLiteral("Failed to open database ") + config.database_path + QStringLiteral(": ")
                    + QString::fromStdString(db_result.unwrap_err().message));
        return 1;
    }
    auto db = std::move(db_result).unwrap();
    storage::ReplicaRepository repo(db);

    store::ReplicaStore store(actor);
    if (store.initialization_error()) {
        qWarning() << "SketchSync:" << QString::fromStdString(*store.initialization_error());
    }
    restore_replica(store, repo);

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("run") : positional.first();
    const auto argument = positional.mid(1).join(QLatin1Char(' '));

    if (command == QStringLiteral("show")) {
        const auto opts = ui::ShowOptions{.includeIds = parser.isSet(includeIdsOption)};
        const auto output = parser.isSet(jsonOption)
            ? ui::format_document_json(store.document(), store.actor(), Timestamp::now(), opts)
            : ui::format_document(store.document(), store.actor(), Timestamp::now(), opts);
        QTextStream(stdout) << output;
        return 0;
    }

    if (command == QStringLiteral("title")) {
        if (argument.isEmpty()) {
            print_error(QStringLiteral("usage: sketchsync title <text>"));
            return 1;
        }
        return finish_edit(store.update_title(argument.toStdString()), store, repo);
    }

    if (command == QStringLiteral("note")) {
        if (argument.isEmpty()) {
            print_error(QStringLiteral("usage: sketchsync note <text>"));
            return 1;
        }
        return finish_edit(store.add_note(argument.toStdString(), canvas::Point{0.0, 0.0}, "#fef08a"),
                           store, repo);
    }

    if (command == QStringLiteral("reset")) {
        return finish_edit(store.reset(), store, repo);
    }

    if (command != QStringLiteral("run")) {
        print_error(QStringLiteral("Unknown command: ") + command);
        return 1;
    }

    ui::install_file_logging();
    qInfo() << "SketchSync: logging to" << ui::default_log_file_path();
    ui::set_log_context(QString::fromStdString(actor), config.endpoint);
    if (config.debug_sync) {
        qInfo() << "SketchSync: sync debug enabled";
    }

    network::SyncTransport transport(network::TransportOptions{
        .endpoint = config.endpoint,
        .reconnect = config.reconnect
    });
    network::SyncSession session(store, transport);
    session.enablePersistence(repo);
    ui::SketchController controller(store, transport, config.heartbeat_interval);

    QObject::connect(&session, &network::SyncSession::remoteMerged, &app, [&controller](int added) {
        qInfo() << "SketchSync: merged" << added << "remote changes; title"
                << controller.title() << "elements" << controller.elementCount();
    });
    QObject::connect(&controller, &ui::SketchController::initializationErrorChanged, &app, [&controller]() {
        if (!controller.initializationError().isEmpty()) {
            qWarning() << "SketchSync:" << controller.initializationError();
        }
    });
    QObject::connect(&transport, &network::SyncTransport::reconnectGaveUp, &app, []() {
        QCoreApplication::exit(2);
    });

    transport.open();
    return app.exec();
}
