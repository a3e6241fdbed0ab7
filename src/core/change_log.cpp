#include "core/change_log.hpp"

#include <algorithm>
#include <limits>

namespace sketchsync::crdt {

std::optional<std::string> validate_operation(const Operation& op) {
    return std::visit([](const auto& o) -> std::optional<std::string> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ops::InsertElement>) {
            return canvas::validate_element(o.element);
        } else if constexpr (std::is_same_v<T, ops::SetNoteText>) {
            if (o.element_id.empty()) return std::string("note update without element id");
            if (!o.timestamp.in_range()) return std::string("note timestamp is out of range");
        } else if constexpr (std::is_same_v<T, ops::SetCursor>) {
            if (o.actor.empty()) return std::string("cursor update without actor");
            if (!canvas::is_finite(o.position)) return std::string("cursor position is not finite");
            if (!o.last_active.in_range()) return std::string("cursor timestamp is out of range");
        }
        return std::nullopt;
    }, op);
}

ChangeLog::ChangeLog()
    : state_(canvas::make_default_canvas())
{
}

Result<ChangeLog, Error> ChangeLog::from_changes(std::vector<Change> changes) {
    // Dependencies always carry smaller counters, so this order visits every
    // dependency before the changes that need it.
    std::sort(changes.begin(), changes.end(), [](const Change& a, const Change& b) {
        if (a.start_op != b.start_op) return a.start_op < b.start_op;
        if (a.actor != b.actor) return a.actor < b.actor;
        return a.seq < b.seq;
    });

    ChangeLog log;
    for (auto& change : changes) {
        if (auto problem = log.check_change(change)) {
            return Result<ChangeLog, Error>::err(Error{
                "Invalid change " + change.actor + "#" + std::to_string(change.seq) + ": " + *problem,
                ErrorCode::MergeRejected});
        }
        log.insert(std::move(change));
    }
    log.rematerialize();
    return Result<ChangeLog, Error>::ok(std::move(log));
}

Result<const Change*, Error> ChangeLog::append_local(const ActorId& actor,
                                                     std::vector<Operation> ops,
                                                     Timestamp now) {
    if (actor.empty()) {
        return Result<const Change*, Error>::err(Error{"Local change without actor", ErrorCode::InvalidArgument});
    }
    if (ops.empty()) {
        return Result<const Change*, Error>::err(Error{"Local change without operations", ErrorCode::InvalidArgument});
    }
    for (const auto& op : ops) {
        if (auto problem = validate_operation(op)) {
            return Result<const Change*, Error>::err(Error{*problem, ErrorCode::InvalidArgument});
        }
    }

    Change change;
    change.actor = actor;
    change.seq = by_actor_[actor].size() + 1;
    change.start_op = max_op_ + 1;
    change.timestamp = now;
    change.deps = clock();
    change.deps.erase(actor);
    change.ops = std::move(ops);

    // The new operations carry the largest ids in the log, so folding them
    // onto the current state equals a full replay.
    for (const auto& op : change.ops) {
        apply(op);
    }

    const auto key_actor = change.actor;
    const auto key_seq = change.seq;
    insert(std::move(change));
    return Result<const Change*, Error>::ok(find(key_actor, key_seq));
}

Result<MergeStats, Error> ChangeLog::merge(const ChangeLog& other) {
    MergeStats stats;
    std::vector<const Change*> incoming;
    std::map<ActorId, uint64_t> next_seq;

    const auto other_changes = other.changes();
    for (const auto& change : other_changes) {
        if (const auto* known = find(change.actor, change.seq)) {
            if (!(*known == change)) {
                return Result<MergeStats, Error>::err(Error{
                    "Conflicting history for " + change.actor + "#" + std::to_string(change.seq),
                    ErrorCode::MergeRejected});
            }
            ++stats.duplicates;
            continue;
        }

        auto [it, inserted] = next_seq.try_emplace(change.actor, 0);
        if (inserted) {
            auto known_it = by_actor_.find(change.actor);
            it->second = (known_it == by_actor_.end() ? 0 : known_it->second.size()) + 1;
        }
        if (change.seq != it->second) {
            return Result<MergeStats, Error>::err(Error{
                "Gap in history of " + change.actor, ErrorCode::MergeRejected});
        }
        ++it->second;
        incoming.push_back(&change);
    }

    if (incoming.empty()) {
        return Result<MergeStats, Error>::ok(stats);
    }

    for (const auto* change : incoming) {
        insert(*change);
    }
    stats.added = incoming.size();
    rematerialize();
    return Result<MergeStats, Error>::ok(stats);
}

canvas::Document ChangeLog::document() const {
    if (!has_canvas_) {
        return canvas::Document{};
    }
    return canvas::Document{state_};
}

std::vector<Change> ChangeLog::changes() const {
    std::vector<Change> out;
    out.reserve(count_);
    for (const auto& [actor, list] : by_actor_) {
        out.insert(out.end(), list.begin(), list.end());
    }
    std::sort(out.begin(), out.end(), [](const Change& a, const Change& b) {
        if (a.start_op != b.start_op) return a.start_op < b.start_op;
        return a.actor < b.actor;
    });
    return out;
}

VectorClock ChangeLog::clock() const {
    VectorClock clock;
    for (const auto& [actor, list] : by_actor_) {
        if (!list.empty()) {
            clock[actor] = list.size();
        }
    }
    return clock;
}

const Change* ChangeLog::find(const ActorId& actor, uint64_t seq) const {
    auto it = by_actor_.find(actor);
    if (it == by_actor_.end() || seq == 0 || seq > it->second.size()) {
        return nullptr;
    }
    return &it->second[seq - 1];
}

std::optional<std::string> ChangeLog::check_change(const Change& change) const {
    if (change.actor.empty()) {
        return std::string("missing actor");
    }
    if (change.ops.empty()) {
        return std::string("no operations");
    }
    if (change.start_op == 0 ||
        change.start_op > std::numeric_limits<uint64_t>::max() - change.ops.size()) {
        return std::string("operation counter out of range");
    }

    auto own = by_actor_.find(change.actor);
    const uint64_t known = own == by_actor_.end() ? 0 : own->second.size();
    if (change.seq != known + 1) {
        return std::string("sequence is not contiguous");
    }
    if (known > 0 && change.start_op <= own->second.back().last_op()) {
        return std::string("counter does not follow previous change");
    }

    for (const auto& [dep_actor, dep_seq] : change.deps) {
        if (dep_actor == change.actor) {
            return std::string("change depends on its own actor");
        }
        const auto* dep = find(dep_actor, dep_seq);
        if (!dep) {
            return std::string("missing dependency ") + dep_actor + "#" + std::to_string(dep_seq);
        }
        if (change.start_op <= dep->last_op()) {
            return std::string("counter does not follow dependency");
        }
    }

    for (const auto& op : change.ops) {
        if (auto problem = validate_operation(op)) {
            return problem;
        }
    }
    return std::nullopt;
}

void ChangeLog::insert(Change change) {
    max_op_ = std::max(max_op_, change.last_op());
    by_actor_[change.actor].push_back(std::move(change));
    ++count_;
}

void ChangeLog::apply(const Operation& op) {
    std::visit([this](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ops::MakeCanvas>) {
            has_canvas_ = true;
        } else if constexpr (std::is_same_v<T, ops::SetTitle>) {
            state_.title = o.title;
        } else if constexpr (std::is_same_v<T, ops::InsertElement>) {
            // Ids are unique in practice; should two inserts collide, the
            // lower OpId is kept on every replica.
            if (element_ids_.insert(canvas::element_id(o.element)).second) {
                state_.elements.push_back(o.element);
            }
        } else if constexpr (std::is_same_v<T, ops::SetNoteText>) {
            if (auto* note = canvas::find_note(state_, o.element_id)) {
                note->text = o.text;
                note->timestamp = o.timestamp;
            }
        } else if constexpr (std::is_same_v<T, ops::SetCursor>) {
            state_.cursors[o.actor] = canvas::Cursor{o.position, o.last_active};
        }
    }, op);
}

void ChangeLog::rematerialize() {
    std::vector<std::pair<OpId, const Operation*>> ordered;
    for (const auto& [actor, list] : by_actor_) {
        for (const auto& change : list) {
            for (size_t i = 0; i < change.ops.size(); ++i) {
                ordered.emplace_back(change.op_id(i), &change.ops[i]);
            }
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    has_canvas_ = false;
    state_ = canvas::make_default_canvas();
    element_ids_.clear();
    for (const auto& [id, op] : ordered) {
        apply(*op);
    }
}

} // namespace sketchsync::crdt
