#include "core/replica_store.hpp"
#include "core/snapshot_codec.hpp"

#include <algorithm>

namespace sketchsync::store {

namespace {

Result<crdt::ChangeLog, Error> structured_init(const ActorId& actor, Timestamp now) {
    crdt::ChangeLog log;
    std::vector<crdt::Operation> ops{
        crdt::ops::MakeCanvas{},
        crdt::ops::SetTitle{std::string(canvas::DEFAULT_TITLE)}
    };
    auto appended = log.append_local(actor, std::move(ops), now);
    if (appended.is_err()) {
        return Result<crdt::ChangeLog, Error>::err(appended.unwrap_err());
    }
    return Result<crdt::ChangeLog, Error>::ok(std::move(log));
}

Result<crdt::ChangeLog, Error> manual_init(const ActorId& actor, Timestamp now) {
    crdt::ChangeLog log;
    auto repaired = inject_default_canvas(log, actor, now);
    if (repaired.is_err()) {
        return Result<crdt::ChangeLog, Error>::err(repaired.unwrap_err());
    }
    return Result<crdt::ChangeLog, Error>::ok(std::move(log));
}

Result<crdt::ChangeLog, Error> bare_init(const ActorId&, Timestamp) {
    return Result<crdt::ChangeLog, Error>::ok(crdt::ChangeLog{});
}

Error failed(const Error& cause) {
    return Error{"Failed to initialize document: " + cause.message, ErrorCode::InitializationFailed};
}

} // anonymous namespace

std::vector<InitStrategy> default_init_strategies() {
    return {
        InitStrategy{"structured", structured_init},
        InitStrategy{"manual", manual_init},
        InitStrategy{"bare", bare_init},
    };
}

Result<void, Error> inject_default_canvas(crdt::ChangeLog& log, const ActorId& actor, Timestamp now) {
    if (log.has_canvas()) {
        return Result<void, Error>::ok();
    }
    auto appended = log.append_local(actor, {crdt::ops::MakeCanvas{}}, now);
    if (appended.is_err()) {
        return Result<void, Error>::err(appended.unwrap_err());
    }
    return Result<void, Error>::ok();
}

ReplicaStore::ReplicaStore(ActorId actor, StoreOptions options)
    : actor_(std::move(actor))
    , options_(std::move(options))
{
    if (!options_.now) {
        options_.now = &Timestamp::now;
    }
    // The outcome is kept in state_ and init_error_.
    (void)initialize();
}

Result<void, Error> ReplicaStore::add_stroke(std::vector<canvas::Point> points,
                                             std::string color,
                                             int width) {
    if (points.empty()) {
        return Result<void, Error>::err(Error{"A stroke needs at least one point", ErrorCode::InvalidArgument});
    }
    if (width <= 0) {
        return Result<void, Error>::err(Error{"Stroke width must be positive", ErrorCode::InvalidArgument});
    }

    canvas::Stroke stroke{
        .id = generate_element_id(),
        .creator = actor_,
        .timestamp = options_.now(),
        .points = std::move(points),
        .color = std::move(color),
        .width = width
    };
    if (auto problem = canvas::validate_element(stroke)) {
        return Result<void, Error>::err(Error{*problem, ErrorCode::InvalidArgument});
    }
    return commit({crdt::ops::InsertElement{std::move(stroke)}});
}

Result<void, Error> ReplicaStore::add_note(std::string text,
                                           canvas::Point position,
                                           std::string color) {
    canvas::Note note{
        .id = generate_element_id(),
        .creator = actor_,
        .timestamp = options_.now(),
        .text = std::move(text),
        .position = position,
        .color = std::move(color)
    };
    if (auto problem = canvas::validate_element(note)) {
        return Result<void, Error>::err(Error{*problem, ErrorCode::InvalidArgument});
    }
    return commit({crdt::ops::InsertElement{std::move(note)}});
}

Result<void, Error> ReplicaStore::update_note(std::string_view id, std::string text) {
    auto repaired = ensure_canvas();
    if (repaired.is_err()) {
        return Result<void, Error>::err(repaired.unwrap_err());
    }

    const auto& current = *document_.canvas;
    if (!canvas::find_note(current, id)) {
        if (repaired.unwrap()) {
            notify(ChangeOrigin::Local);
        }
        return Result<void, Error>::ok();
    }
    return commit({crdt::ops::SetNoteText{std::string(id), std::move(text), options_.now()}});
}

Result<void, Error> ReplicaStore::update_title(std::string title) {
    return commit({crdt::ops::SetTitle{std::move(title)}});
}

Result<void, Error> ReplicaStore::update_cursor(const ActorId& actor, double x, double y) {
    if (actor.empty()) {
        return Result<void, Error>::err(Error{"Cursor update without actor", ErrorCode::InvalidArgument});
    }
    const canvas::Point position{x, y};
    if (!canvas::is_finite(position)) {
        return Result<void, Error>::err(Error{"Cursor position is not finite", ErrorCode::InvalidArgument});
    }
    return commit({crdt::ops::SetCursor{actor, position, options_.now()}});
}

Result<crdt::MergeStats, Error> ReplicaStore::merge_incoming(std::span<const uint8_t> bytes) {
    if (state_ == InitState::Failed) {
        return Result<crdt::MergeStats, Error>::err(
            Error{init_error_.value_or("Document is not initialized"), ErrorCode::InitializationExhausted});
    }

    auto decoded = codec::decode_snapshot(bytes);
    if (decoded.is_err()) {
        return Result<crdt::MergeStats, Error>::err(decoded.unwrap_err());
    }

    // Merge into a copy so that a rejected snapshot leaves no trace.
    crdt::ChangeLog merged = log_;
    auto stats = merged.merge(decoded.unwrap());
    if (stats.is_err()) {
        return stats;
    }
    if (stats.unwrap().added == 0) {
        return stats;
    }

    log_ = std::move(merged);
    if (log_.has_canvas()) {
        state_ = InitState::Ready;
        init_error_.reset();
    }
    refresh();
    notify(ChangeOrigin::Remote);
    return stats;
}

std::vector<uint8_t> ReplicaStore::save() const {
    return codec::encode_snapshot(log_);
}

Result<void, Error> ReplicaStore::load(std::span<const uint8_t> bytes) {
    auto decoded = codec::decode_snapshot(bytes);
    if (decoded.is_err()) {
        return Result<void, Error>::err(decoded.unwrap_err());
    }

    log_ = std::move(decoded).unwrap();
    history_actor_ = make_history_actor(actor_);
    state_ = log_.has_canvas() ? InitState::Ready : InitState::Degraded;
    init_error_.reset();
    repair_attempts_ = 0;
    refresh();
    notify(ChangeOrigin::Loaded);
    return Result<void, Error>::ok();
}

Result<void, Error> ReplicaStore::reset() {
    auto result = initialize();
    notify(ChangeOrigin::Reset);
    return result;
}

ReplicaStore::ObserverId ReplicaStore::subscribe(Observer observer) {
    const auto id = next_observer_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}

void ReplicaStore::unsubscribe(ObserverId id) {
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     observers_.end());
}

Result<void, Error> ReplicaStore::initialize() {
    log_ = crdt::ChangeLog{};
    history_actor_ = make_history_actor(actor_);
    state_ = InitState::Uninitialized;
    init_error_.reset();
    repair_attempts_ = 0;

    Error last_error{"no initialization strategy configured", ErrorCode::InitializationFailed};
    for (const auto& strategy : options_.strategies) {
        if (!strategy.build) {
            continue;
        }
        auto built = strategy.build(history_actor_, options_.now());
        if (built.is_err()) {
            last_error = Error{strategy.name + ": " + built.unwrap_err().message, ErrorCode::InitializationFailed};
            continue;
        }
        log_ = std::move(built).unwrap();
        state_ = log_.has_canvas() ? InitState::Ready : InitState::Degraded;
        refresh();
        return Result<void, Error>::ok();
    }

    log_ = crdt::ChangeLog{};
    state_ = InitState::Failed;
    auto error = failed(last_error);
    init_error_ = error.message;
    refresh();
    return Result<void, Error>::err(std::move(error));
}

Result<bool, Error> ReplicaStore::ensure_canvas() {
    if (state_ == InitState::Failed) {
        const auto code = repair_attempts_ >= options_.max_repair_attempts
            ? ErrorCode::InitializationExhausted
            : ErrorCode::InitializationFailed;
        return Result<bool, Error>::err(Error{init_error_.value_or("Document is not initialized"), code});
    }
    if (log_.has_canvas()) {
        return Result<bool, Error>::ok(false);
    }

    ++repair_attempts_;
    auto repaired = options_.repair
        ? options_.repair(log_, history_actor_, options_.now())
        : Result<void, Error>::err(Error{"no repair function configured"});

    if (repaired.is_ok() && log_.has_canvas()) {
        state_ = InitState::Ready;
        init_error_.reset();
        refresh();
        return Result<bool, Error>::ok(true);
    }

    const std::string cause = repaired.is_err() ? repaired.unwrap_err().message
                                                : std::string("repair produced no canvas");
    if (repair_attempts_ >= options_.max_repair_attempts) {
        state_ = InitState::Failed;
        init_error_ = "Failed to initialize document: " + cause + " (gave up after " +
                      std::to_string(repair_attempts_) + " repair attempts)";
        refresh();
        return Result<bool, Error>::err(Error{*init_error_, ErrorCode::InitializationExhausted});
    }
    init_error_ = "Failed to initialize document: " + cause;
    return Result<bool, Error>::err(Error{*init_error_, ErrorCode::InitializationFailed});
}

Result<void, Error> ReplicaStore::commit(std::vector<crdt::Operation> ops) {
    auto repaired = ensure_canvas();
    if (repaired.is_err()) {
        return Result<void, Error>::err(repaired.unwrap_err());
    }

    auto appended = log_.append_local(history_actor_, std::move(ops), options_.now());
    if (appended.is_err()) {
        if (repaired.unwrap()) {
            notify(ChangeOrigin::Local);
        }
        return Result<void, Error>::err(appended.unwrap_err());
    }

    refresh();
    notify(ChangeOrigin::Local);
    return Result<void, Error>::ok();
}

void ReplicaStore::refresh() {
    document_ = log_.document();
}

void ReplicaStore::notify(ChangeOrigin origin) {
    // Observers may unsubscribe while being called.
    const auto observers = observers_;
    for (const auto& [id, observer] : observers) {
        if (observer) {
            observer(document_, origin);
        }
    }
}

} // namespace sketchsync::store
