#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace sketchsync::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "replica_snapshots",
        .up_sql = R"SQL(
            -- Latest saved history of each local replica
            CREATE TABLE IF NOT EXISTS replica_snapshots (
                doc_key TEXT PRIMARY KEY,
                snapshot BLOB NOT NULL,
                actor_id TEXT NOT NULL,
                updated_at INTEGER NOT NULL
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "replica_snapshots_actor_index",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_replica_snapshots_actor ON replica_snapshots(actor_id);
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Get the current schema version.
     */
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(int version);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace sketchsync::storage
