#pragma once

#include "core/canvas.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace sketchsync::crdt {

/**
 * OpId - Identity and total order of an operation.
 *
 * counter is a Lamport clock: an operation created after another one was
 * seen always carries a larger counter. Ties between concurrent operations
 * are broken by actor id, so every replica picks the same winner.
 */
struct OpId {
    uint64_t counter = 0;
    ActorId actor;

    auto operator<=>(const OpId&) const = default;
    bool operator==(const OpId&) const = default;
};

namespace ops {

struct MakeCanvas {
    bool operator==(const MakeCanvas&) const = default;
};

struct SetTitle {
    std::string title;

    bool operator==(const SetTitle&) const = default;
};

struct InsertElement {
    canvas::CanvasElement element;

    bool operator==(const InsertElement&) const = default;
};

struct SetNoteText {
    std::string element_id;
    std::string text;
    Timestamp timestamp;

    bool operator==(const SetNoteText&) const = default;
};

struct SetCursor {
    ActorId actor;
    canvas::Point position;
    Timestamp last_active;

    bool operator==(const SetCursor&) const = default;
};

} // namespace ops

using Operation = std::variant<
    ops::MakeCanvas,
    ops::SetTitle,
    ops::InsertElement,
    ops::SetNoteText,
    ops::SetCursor
>;

/**
 * VectorClock - Highest sequence number seen per actor.
 */
using VectorClock = std::map<ActorId, uint64_t>;

/**
 * Change - Operations applied atomically by one actor.
 *
 * deps lists the other actors' changes this one was aware of; the actor's
 * own previous change (seq - 1) is an implicit dependency.
 */
struct Change {
    ActorId actor;
    uint64_t seq = 0;
    uint64_t start_op = 0;
    Timestamp timestamp;
    VectorClock deps;
    std::vector<Operation> ops;

    [[nodiscard]] uint64_t last_op() const { return start_op + ops.size() - 1; }
    [[nodiscard]] OpId op_id(size_t index) const { return OpId{start_op + index, actor}; }

    bool operator==(const Change&) const = default;
};

struct MergeStats {
    size_t added = 0;
    size_t duplicates = 0;
};

/**
 * ChangeLog - The causal history of a replica and the document it folds to.
 *
 * The document is the fold of every operation sorted by OpId. Merging is a
 * set union keyed by (actor, seq), so it is commutative, associative and
 * idempotent, and replicas holding the same set of changes materialize the
 * same document.
 */
class ChangeLog {
public:
    ChangeLog();

    /**
     * Build a log from decoded changes, rejecting anything that is not a
     * causally closed, well formed history.
     */
    [[nodiscard]] static Result<ChangeLog, Error> from_changes(std::vector<Change> changes);

    /**
     * Record a local change authored by actor. The change depends on every
     * change currently in the log.
     */
    [[nodiscard]] Result<const Change*, Error> append_local(const ActorId& actor,
                                                            std::vector<Operation> ops,
                                                            Timestamp now);

    /**
     * Union other into this log. Nothing is applied if other holds a change
     * that contradicts a known one with the same (actor, seq).
     */
    [[nodiscard]] Result<MergeStats, Error> merge(const ChangeLog& other);

    [[nodiscard]] canvas::Document document() const;
    [[nodiscard]] bool has_canvas() const { return has_canvas_; }

    /**
     * All changes in canonical (start_op, actor) order.
     */
    [[nodiscard]] std::vector<Change> changes() const;

    [[nodiscard]] VectorClock clock() const;
    [[nodiscard]] uint64_t max_op() const { return max_op_; }
    [[nodiscard]] size_t size() const { return count_; }
    [[nodiscard]] bool empty() const { return count_ == 0; }

    [[nodiscard]] const Change* find(const ActorId& actor, uint64_t seq) const;

private:
    std::map<ActorId, std::vector<Change>> by_actor_;
    size_t count_ = 0;
    uint64_t max_op_ = 0;

    bool has_canvas_ = false;
    canvas::Canvas state_;
    std::set<std::string> element_ids_;

    [[nodiscard]] std::optional<std::string> check_change(const Change& change) const;
    void insert(Change change);
    void apply(const Operation& op);
    void rematerialize();
};

[[nodiscard]] std::optional<std::string> validate_operation(const Operation& op);

} // namespace sketchsync::crdt
