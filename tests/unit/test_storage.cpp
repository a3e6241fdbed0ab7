#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/replica_repository.hpp"
#include "core/replica_store.hpp"

using namespace sketchsync;
using namespace sketchsync::storage;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Execute reports SQL errors") {
        auto result = db.execute("CREATE TABLE;");
        REQUIRE(result.is_err());
        REQUIRE_FALSE(db.last_error().empty());
    }

    SECTION("Prepare, bind and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT, data BLOB);").is_ok());

        auto insert = db.prepare("INSERT INTO test VALUES (?, ?, ?);").unwrap();
        const std::vector<uint8_t> blob{0x00, 0x53, 0x4B, 0xFF};
        REQUIRE(insert.bind_int(1, 7)
                    .and_then([&] { return insert.bind_text(2, "Alice"); })
                    .and_then([&] { return insert.bind_blob(3, blob.data(), blob.size()); })
                    .is_ok());
        REQUIRE(insert.step().unwrap() == false);
        REQUIRE(db.changes() == 1);

        auto stmt = db.prepare("SELECT id, name, data FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 7);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE(stmt.column_blob(2) == blob);
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            return db.execute("INSERT INTO test VALUES (1);")
                .and_then([&] { return db.execute("INSERT INTO test VALUES (2);"); });
        });

        REQUIRE(result.is_ok());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (2);");
            if (inserted.is_err()) {
                return inserted;
            }
            return Result<void, Error>::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
        REQUIRE(db.execute("SELECT doc_key, snapshot, actor_id, updated_at FROM replica_snapshots;").is_ok());
    }

    SECTION("Migrate to a specific version") {
        REQUIRE(runner.migrate_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);
    }

    SECTION("Migrating twice is a no-op") {
        REQUIRE(initialize_database(db).is_ok());
        REQUIRE(initialize_database(db).is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }
}

TEST_CASE("ReplicaRepository stores one snapshot per document key", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    ReplicaRepository repo(db);

    SECTION("Missing key loads as empty") {
        auto loaded = repo.load_snapshot(ReplicaRepository::DEFAULT_DOC_KEY);
        REQUIRE(loaded.is_ok());
        REQUIRE_FALSE(loaded.unwrap().has_value());
    }

    SECTION("Save then load") {
        store::ReplicaStore replica("actor-a");
        REQUIRE(replica.update_title("Persisted").is_ok());

        const ReplicaSnapshot saved{
            .doc_key = ReplicaRepository::DEFAULT_DOC_KEY,
            .snapshot = replica.save(),
            .actor_id = replica.actor(),
            .updated_at = Timestamp(42)
        };
        REQUIRE(repo.save_snapshot(saved).is_ok());

        auto loaded = repo.load_snapshot(ReplicaRepository::DEFAULT_DOC_KEY);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap().has_value());
        const auto& row = *loaded.unwrap();
        REQUIRE(row.snapshot == saved.snapshot);
        REQUIRE(row.actor_id == "actor-a");
        REQUIRE(row.updated_at == Timestamp(42));

        store::ReplicaStore restored("actor-a");
        REQUIRE(restored.load(row.snapshot).is_ok());
        REQUIRE(restored.document().canvas->title == "Persisted");
    }

    SECTION("Saving again replaces the row") {
        REQUIRE(repo.save_snapshot({.doc_key = "doc", .snapshot = {1}, .actor_id = "a", .updated_at = Timestamp(1)}).is_ok());
        REQUIRE(repo.save_snapshot({.doc_key = "doc", .snapshot = {2, 3}, .actor_id = "b", .updated_at = Timestamp(2)}).is_ok());

        auto row = repo.load_snapshot("doc").unwrap();
        REQUIRE(row.has_value());
        REQUIRE(row->snapshot == std::vector<uint8_t>{2, 3});
        REQUIRE(row->actor_id == "b");

        auto count = db.prepare("SELECT COUNT(*) FROM replica_snapshots;").unwrap();
        REQUIRE(count.step().unwrap());
        REQUIRE(count.column_int(0) == 1);
    }

    SECTION("Remove deletes the row") {
        REQUIRE(repo.save_snapshot({.doc_key = "doc", .snapshot = {1}, .actor_id = "a", .updated_at = Timestamp(1)}).is_ok());
        REQUIRE(repo.remove_snapshot("doc").is_ok());
        REQUIRE_FALSE(repo.load_snapshot("doc").unwrap().has_value());
    }

    SECTION("Empty key is rejected") {
        auto result = repo.save_snapshot({.doc_key = "", .snapshot = {1}, .actor_id = "a", .updated_at = Timestamp(1)});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorCode::InvalidArgument));
    }
}
