#pragma once

#include "core/canvas.hpp"
#include "core/change_log.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sketchsync::store {

/**
 * InitState - Lifecycle of the local replica.
 *
 * Uninitialized -> Ready          first strategy that yields a canvas
 * Uninitialized -> Degraded       only the bare strategy succeeded
 * Degraded      -> Ready          repair on the next mutation
 * Degraded      -> Failed         repair attempts exhausted
 * Uninitialized -> Failed         every strategy failed
 * any           -> (reset)        strategies run again
 */
enum class InitState {
    Uninitialized,
    Ready,
    Degraded,
    Failed
};

enum class ChangeOrigin {
    Local,
    Remote,
    Loaded,
    Reset
};

[[nodiscard]] constexpr std::string_view to_string(InitState state) {
    switch (state) {
        case InitState::Uninitialized: return "uninitialized";
        case InitState::Ready: return "ready";
        case InitState::Degraded: return "degraded";
        case InitState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * InitStrategy - One way of constructing a fresh replica history.
 */
struct InitStrategy {
    std::string name;
    std::function<Result<crdt::ChangeLog, Error>(const ActorId&, Timestamp)> build;
};

/**
 * The default chain: structured, manual, bare.
 */
[[nodiscard]] std::vector<InitStrategy> default_init_strategies();

/**
 * RepairFn - Adds the missing canvas to a degraded history.
 */
using RepairFn = std::function<Result<void, Error>(crdt::ChangeLog&, const ActorId&, Timestamp)>;

[[nodiscard]] Result<void, Error> inject_default_canvas(crdt::ChangeLog& log,
                                                        const ActorId& actor,
                                                        Timestamp now);

struct StoreOptions {
    std::vector<InitStrategy> strategies = default_init_strategies();
    RepairFn repair = inject_default_canvas;
    int max_repair_attempts = 3;
    NowFn now = &Timestamp::now;
};

/**
 * ReplicaStore - The single owner of the local replica.
 *
 * Every mutation is applied to the local history synchronously and then
 * announced to observers; nothing here waits on the network. Consumers hold
 * a reference to the store and read document() but never mutate it.
 *
 * actor() is the user's identity, stamped on elements and cursors. Changes
 * are recorded under history_actor(), which is drawn fresh by every init,
 * reset and load.
 */
class ReplicaStore {
public:
    using Observer = std::function<void(const canvas::Document&, ChangeOrigin)>;
    using ObserverId = size_t;

    explicit ReplicaStore(ActorId actor, StoreOptions options = {});

    ReplicaStore(const ReplicaStore&) = delete;
    ReplicaStore& operator=(const ReplicaStore&) = delete;

    // Mutations

    [[nodiscard]] Result<void, Error> add_stroke(std::vector<canvas::Point> points,
                                                 std::string color,
                                                 int width);

    [[nodiscard]] Result<void, Error> add_note(std::string text,
                                               canvas::Point position,
                                               std::string color);

    /**
     * Set the text of a note. Unknown ids and non-note elements are ignored.
     */
    [[nodiscard]] Result<void, Error> update_note(std::string_view id, std::string text);

    [[nodiscard]] Result<void, Error> update_title(std::string title);

    [[nodiscard]] Result<void, Error> update_cursor(const ActorId& actor, double x, double y);

    // Replication

    /**
     * Merge a remote snapshot. On any failure the local state is unchanged.
     */
    [[nodiscard]] Result<crdt::MergeStats, Error> merge_incoming(std::span<const uint8_t> bytes);

    /**
     * Serialize the full causal history.
     */
    [[nodiscard]] std::vector<uint8_t> save() const;

    /**
     * Replace the local history with a previously saved one. Further edits
     * are recorded under a new history actor.
     */
    [[nodiscard]] Result<void, Error> load(std::span<const uint8_t> bytes);

    /**
     * Discard all history and start over from the init strategies.
     */
    [[nodiscard]] Result<void, Error> reset();

    // State

    [[nodiscard]] const canvas::Document& document() const { return document_; }
    [[nodiscard]] const crdt::ChangeLog& history() const { return log_; }
    [[nodiscard]] const ActorId& actor() const { return actor_; }
    [[nodiscard]] const ActorId& history_actor() const { return history_actor_; }
    [[nodiscard]] InitState init_state() const { return state_; }
    [[nodiscard]] const std::optional<std::string>& initialization_error() const { return init_error_; }
    [[nodiscard]] int repair_attempts() const { return repair_attempts_; }

    ObserverId subscribe(Observer observer);
    void unsubscribe(ObserverId id);

private:
    ActorId actor_;
    ActorId history_actor_;
    StoreOptions options_;

    crdt::ChangeLog log_;
    canvas::Document document_;
    InitState state_ = InitState::Uninitialized;
    std::optional<std::string> init_error_;
    int repair_attempts_ = 0;

    std::vector<std::pair<ObserverId, Observer>> observers_;
    ObserverId next_observer_id_ = 1;

    [[nodiscard]] Result<void, Error> initialize();
    [[nodiscard]] Result<bool, Error> ensure_canvas();
    [[nodiscard]] Result<void, Error> commit(std::vector<crdt::Operation> ops);
    void refresh();
    void notify(ChangeOrigin origin);
};

} // namespace sketchsync::store
