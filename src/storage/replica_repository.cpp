#include "storage/replica_repository.hpp"

namespace sketchsync::storage {

Result<std::optional<ReplicaSnapshot>, Error> ReplicaRepository::load_snapshot(
    const std::string& doc_key
) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT doc_key, snapshot, actor_id, updated_at
        FROM replica_snapshots WHERE doc_key = ?;
    )SQL");

    if (stmt_result.is_err()) {
        return Result<std::optional<ReplicaSnapshot>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, doc_key);
    if (bound.is_err()) {
        return Result<std::optional<ReplicaSnapshot>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<ReplicaSnapshot>, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap()) {
        return Result<std::optional<ReplicaSnapshot>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<ReplicaSnapshot>, Error>::ok(ReplicaSnapshot{
        .doc_key = stmt.column_text(0),
        .snapshot = stmt.column_blob(1),
        .actor_id = stmt.column_text(2),
        .updated_at = Timestamp(stmt.column_int64(3))
    });
}

Result<void, Error> ReplicaRepository::save_snapshot(const ReplicaSnapshot& snapshot) {
    if (snapshot.doc_key.empty()) {
        return Result<void, Error>::err(Error{"Snapshot without document key", ErrorCode::InvalidArgument});
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO replica_snapshots (doc_key, snapshot, actor_id, updated_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(doc_key) DO UPDATE SET
            snapshot = excluded.snapshot,
            actor_id = excluded.actor_id,
            updated_at = excluded.updated_at;
    )SQL");

    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, snapshot.doc_key)
        .and_then([&] { return stmt.bind_blob(2, snapshot.snapshot.data(), snapshot.snapshot.size()); })
        .and_then([&] { return stmt.bind_text(3, snapshot.actor_id); })
        .and_then([&] { return stmt.bind_int64(4, snapshot.updated_at.millis()); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

Result<void, Error> ReplicaRepository::remove_snapshot(const std::string& doc_key) {
    auto stmt_result = db_.prepare("DELETE FROM replica_snapshots WHERE doc_key = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, doc_key);
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

} // namespace sketchsync::storage
