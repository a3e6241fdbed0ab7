#pragma once

#include "storage/database.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace sketchsync::storage {

/**
 * ReplicaSnapshot - The saved history of one local replica.
 */
struct ReplicaSnapshot {
    std::string doc_key;
    std::vector<uint8_t> snapshot;
    ActorId actor_id;
    Timestamp updated_at;
};

/**
 * ReplicaRepository - Data access layer for replica snapshots.
 */
class ReplicaRepository {
public:
    static constexpr const char* DEFAULT_DOC_KEY = "default";

    explicit ReplicaRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<ReplicaSnapshot>, Error> load_snapshot(
        const std::string& doc_key);

    /**
     * Insert or replace the snapshot stored under snapshot.doc_key.
     */
    [[nodiscard]] Result<void, Error> save_snapshot(const ReplicaSnapshot& snapshot);

    [[nodiscard]] Result<void, Error> remove_snapshot(const std::string& doc_key);

private:
    Database& db_;
};

} // namespace sketchsync::storage
