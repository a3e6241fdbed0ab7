#include <catch2/catch_test_macros.hpp>
#include "core/replica_store.hpp"
#include "core/snapshot_codec.hpp"

#include <limits>
#include <memory>

using namespace sketchsync;
using namespace sketchsync::store;

namespace {

Timestamp fixed_now() {
    return Timestamp(1'700'000'000'000);
}

InitStrategy failing(std::string name) {
    return InitStrategy{std::move(name), [](const ActorId&, Timestamp) {
        return Result<crdt::ChangeLog, Error>::err(Error{"boom", ErrorCode::InitializationFailed});
    }};
}

InitStrategy bare_only() {
    return default_init_strategies().back();
}

struct Recorder {
    std::vector<ChangeOrigin> origins;
    std::vector<size_t> element_counts;

    ReplicaStore::Observer observer() {
        return [this](const canvas::Document& doc, ChangeOrigin origin) {
            origins.push_back(origin);
            element_counts.push_back(doc.canvas ? doc.canvas->elements.size() : 0);
        };
    }
};

} // namespace

TEST_CASE("Default strategies produce a ready canvas", "[store]") {
    ReplicaStore store("actor-a");

    REQUIRE(store.init_state() == InitState::Ready);
    REQUIRE_FALSE(store.initialization_error().has_value());
    REQUIRE(store.document().canvas.has_value());
    REQUIRE(store.document().canvas->title == "Untitled Sketch");
    REQUIRE(store.document().canvas->elements.empty());
    REQUIRE(store.actor() == "actor-a");
    REQUIRE(store.history_actor().rfind("actor-a:", 0) == 0);
}

TEST_CASE("Initialization falls through the strategy chain", "[store]") {
    SECTION("first failure falls back to the next strategy") {
        auto strategies = default_init_strategies();
        strategies.front() = failing("structured");
        ReplicaStore store("actor-a", StoreOptions{.strategies = strategies});

        REQUIRE(store.init_state() == InitState::Ready);
        REQUIRE(store.document().canvas.has_value());
    }

    SECTION("bare strategy leaves the document degraded") {
        ReplicaStore store("actor-a", StoreOptions{.strategies = {bare_only()}});

        REQUIRE(store.init_state() == InitState::Degraded);
        REQUIRE_FALSE(store.document().canvas.has_value());
    }

    SECTION("all strategies failing is reported, not thrown") {
        ReplicaStore store("actor-a", StoreOptions{.strategies = {failing("structured"), failing("manual")}});

        REQUIRE(store.init_state() == InitState::Failed);
        REQUIRE(store.initialization_error().has_value());
        REQUIRE(store.initialization_error()->rfind("Failed to initialize document: manual: boom", 0) == 0);

        auto edit = store.update_title("x");
        REQUIRE(edit.is_err());
    }
}

TEST_CASE("Mutations repair a missing canvas first", "[store]") {
    Recorder recorder;
    ReplicaStore store("actor-a", StoreOptions{.strategies = {bare_only()}, .now = fixed_now});
    store.subscribe(recorder.observer());

    auto result = store.add_note("hello", canvas::Point{1, 2}, "#fef08a");

    REQUIRE(result.is_ok());
    REQUIRE(store.init_state() == InitState::Ready);
    REQUIRE(store.repair_attempts() == 1);
    REQUIRE(store.document().canvas->elements.size() == 1);

    const auto& note = std::get<canvas::Note>(store.document().canvas->elements.front());
    REQUIRE(note.text == "hello");
    REQUIRE(note.creator == "actor-a");
    REQUIRE(note.timestamp == fixed_now());
    REQUIRE(recorder.origins == std::vector<ChangeOrigin>{ChangeOrigin::Local});
}

TEST_CASE("Repair gives up after the configured number of attempts", "[store]") {
    auto broken = std::make_shared<bool>(true);
    RepairFn repair = [broken](crdt::ChangeLog& log, const ActorId& actor, Timestamp now) {
        if (*broken) {
            return Result<void, Error>::err(Error{"canvas unavailable"});
        }
        return inject_default_canvas(log, actor, now);
    };
    ReplicaStore store("actor-a", StoreOptions{.strategies = {bare_only()}, .repair = repair});

    REQUIRE(store.update_title("1").unwrap_err().is(ErrorCode::InitializationFailed));
    REQUIRE(store.init_state() == InitState::Degraded);
    REQUIRE(store.update_title("2").unwrap_err().is(ErrorCode::InitializationFailed));

    auto third = store.update_title("3");
    REQUIRE(third.unwrap_err().is(ErrorCode::InitializationExhausted));
    REQUIRE(store.init_state() == InitState::Failed);
    REQUIRE(store.repair_attempts() == 3);
    REQUIRE(store.initialization_error()->find("canvas unavailable") != std::string::npos);

    SECTION("no further repair is attempted") {
        REQUIRE(store.update_title("4").unwrap_err().is(ErrorCode::InitializationExhausted));
        REQUIRE(store.repair_attempts() == 3);
        REQUIRE(store.merge_incoming(store.save()).unwrap_err().is(ErrorCode::InitializationExhausted));
    }

    SECTION("reset starts over") {
        *broken = false;
        Recorder recorder;
        store.subscribe(recorder.observer());

        REQUIRE(store.reset().is_ok());
        REQUIRE(store.init_state() == InitState::Degraded);
        REQUIRE(store.repair_attempts() == 0);
        REQUIRE_FALSE(store.initialization_error().has_value());

        REQUIRE(store.update_title("Recovered").is_ok());
        REQUIRE(store.document().canvas->title == "Recovered");
        REQUIRE(recorder.origins == std::vector<ChangeOrigin>{ChangeOrigin::Reset, ChangeOrigin::Local});
    }
}

TEST_CASE("Local edits are visible before observers return", "[store]") {
    ReplicaStore store("actor-a");
    Recorder recorder;
    store.subscribe(recorder.observer());

    REQUIRE(store.add_stroke({{0, 0}, {5, 5}}, "#000000", 2).is_ok());

    REQUIRE(recorder.origins == std::vector<ChangeOrigin>{ChangeOrigin::Local});
    REQUIRE(recorder.element_counts == std::vector<size_t>{1});
    REQUIRE(store.document().canvas->elements.size() == 1);
}

TEST_CASE("Invalid local edits leave the replica unchanged", "[store]") {
    ReplicaStore store("actor-a");
    Recorder recorder;
    store.subscribe(recorder.observer());
    const auto history = store.history().size();

    REQUIRE(store.add_stroke({}, "#000", 2).unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(store.add_stroke({{0, 0}}, "#000", 0).unwrap_err().is(ErrorCode::InvalidArgument));
    REQUIRE(store.update_cursor("actor-a", std::numeric_limits<double>::infinity(), 0).is_err());
    REQUIRE(store.update_cursor("", 1, 1).is_err());

    REQUIRE(store.history().size() == history);
    REQUIRE(recorder.origins.empty());
}

TEST_CASE("update_note is idempotent and ignores unknown ids", "[store]") {
    ReplicaStore store("actor-a", StoreOptions{.now = fixed_now});
    REQUIRE(store.add_note("draft", canvas::Point{0, 0}, "#fef08a").is_ok());
    const auto id = canvas::element_id(store.document().canvas->elements.front());

    REQUIRE(store.update_note(id, "final").is_ok());
    const auto once = store.document();
    REQUIRE(store.update_note(id, "final").is_ok());
    REQUIRE(store.document() == once);
    REQUIRE(canvas::find_note(*store.document().canvas, id)->text == "final");

    SECTION("unknown id") {
        Recorder recorder;
        store.subscribe(recorder.observer());
        const auto size = store.history().size();

        REQUIRE(store.update_note("no-such-note", "x").is_ok());
        REQUIRE(store.history().size() == size);
        REQUIRE(recorder.origins.empty());
    }

    SECTION("stroke ids are not notes") {
        REQUIRE(store.add_stroke({{1, 1}}, "#000", 1).is_ok());
        const auto stroke_id = canvas::element_id(store.document().canvas->elements.back());
        const auto before = store.document();
        REQUIRE(store.update_note(stroke_id, "x").is_ok());
        REQUIRE(store.document() == before);
    }
}

TEST_CASE("Cursor updates are stamped with the injected clock", "[store]") {
    ReplicaStore store("actor-a", StoreOptions{.now = fixed_now});

    REQUIRE(store.update_cursor("actor-a", 10, 20).is_ok());

    const auto& cursor = store.document().canvas->cursors.at("actor-a");
    REQUIRE(cursor.position == canvas::Point{10, 20});
    REQUIRE(cursor.last_active == fixed_now());
}

TEST_CASE("merge_incoming applies remote history", "[store]") {
    ReplicaStore a("actor-a");
    ReplicaStore b("actor-b");
    Recorder recorder;
    b.subscribe(recorder.observer());

    REQUIRE(a.update_title("Shared").is_ok());
    auto merged = b.merge_incoming(a.save());

    REQUIRE(merged.is_ok());
    REQUIRE(merged.unwrap().added > 0);
    REQUIRE(b.document().canvas->title == "Shared");
    REQUIRE(recorder.origins == std::vector<ChangeOrigin>{ChangeOrigin::Remote});

    SECTION("already known history does not notify") {
        auto again = b.merge_incoming(a.save());
        REQUIRE(again.is_ok());
        REQUIRE(again.unwrap().added == 0);
        REQUIRE(recorder.origins.size() == 1);
    }

    SECTION("a degraded replica becomes ready") {
        ReplicaStore degraded("actor-c", StoreOptions{.strategies = {bare_only()}});
        REQUIRE(degraded.merge_incoming(a.save()).is_ok());
        REQUIRE(degraded.init_state() == InitState::Ready);
        REQUIRE(degraded.document().canvas->title == "Shared");
    }
}

TEST_CASE("Rejected snapshots leave the replica untouched", "[store]") {
    ReplicaStore store("actor-a");
    REQUIRE(store.update_title("Mine").is_ok());
    Recorder recorder;
    store.subscribe(recorder.observer());
    const auto before = store.document();
    const auto history = store.history().size();

    SECTION("undecodable bytes") {
        std::vector<uint8_t> garbage{1, 2, 3};
        auto result = store.merge_incoming(garbage);
        REQUIRE(result.unwrap_err().is(ErrorCode::DecodeFailed));
    }

    SECTION("conflicting history for our own actor") {
        crdt::ChangeLog forged;
        REQUIRE(forged.append_local(store.history_actor(), {crdt::ops::SetTitle{"Not mine"}},
                                    fixed_now()).is_ok());
        auto result = store.merge_incoming(codec::encode_snapshot(forged));
        REQUIRE(result.unwrap_err().is(ErrorCode::MergeRejected));
    }

    REQUIRE(store.document() == before);
    REQUIRE(store.history().size() == history);
    REQUIRE(recorder.origins.empty());
}

TEST_CASE("save and load restore the replica", "[store]") {
    ReplicaStore original("actor-a");
    REQUIRE(original.add_note("remember", canvas::Point{3, 4}, "#fef08a").is_ok());
    const auto bytes = original.save();

    ReplicaStore restored("actor-a");
    Recorder recorder;
    restored.subscribe(recorder.observer());

    REQUIRE(restored.load(bytes).is_ok());
    REQUIRE(restored.document() == original.document());
    REQUIRE(restored.history().changes() == original.history().changes());
    REQUIRE(recorder.origins == std::vector<ChangeOrigin>{ChangeOrigin::Loaded});

    SECTION("edits after load are recorded under a new history actor") {
        REQUIRE(restored.history_actor() != original.history_actor());
        REQUIRE(restored.update_title("After load").is_ok());
        REQUIRE(restored.history().find(restored.history_actor(), 1) != nullptr);
        REQUIRE(restored.history().find(original.history_actor(), 2) != nullptr);

        REQUIRE(original.merge_incoming(restored.save()).is_ok());
        REQUIRE(original.document() == restored.document());
    }

    SECTION("a corrupt blob is rejected") {
        std::vector<uint8_t> corrupt(bytes.begin(), bytes.begin() + 10);
        REQUIRE(restored.load(corrupt).is_err());
        REQUIRE(restored.document() == original.document());
    }
}

TEST_CASE("Unsubscribed observers are not called", "[store]") {
    ReplicaStore store("actor-a");
    Recorder recorder;
    const auto id = store.subscribe(recorder.observer());
    store.unsubscribe(id);

    REQUIRE(store.update_title("quiet").is_ok());
    REQUIRE(recorder.origins.empty());
}

TEST_CASE("Every fresh history gets its own history actor", "[store]") {
    ReplicaStore store("actor-a");
    const auto first = store.history_actor();

    REQUIRE(store.reset().is_ok());
    REQUIRE(store.history_actor() != first);
    REQUIRE(store.history_actor().rfind("actor-a:", 0) == 0);

    ReplicaStore same_user("actor-a");
    REQUIRE(same_user.history_actor() != store.history_actor());
}

TEST_CASE("A reset replica keeps converging with its peers", "[store]") {
    ReplicaStore a("actor-a");
    ReplicaStore b("actor-b");

    REQUIRE(a.add_stroke({{0, 0}, {1, 1}, {2, 2}}, "#ff0000", 2).is_ok());
    REQUIRE(b.merge_incoming(a.save()).is_ok());

    REQUIRE(a.reset().is_ok());
    REQUIRE(a.document().canvas->elements.empty());
    REQUIRE(a.add_stroke({{5, 5}, {6, 6}, {7, 7}}, "#0000ff", 3).is_ok());

    auto into_b = b.merge_incoming(a.save());
    REQUIRE(into_b.is_ok());
    auto into_a = a.merge_incoming(b.save());
    REQUIRE(into_a.is_ok());

    REQUIRE(a.document() == b.document());
    REQUIRE(canvas::strokes(*a.document().canvas).size() == 2);

    SECTION("a restart that lost the saved snapshot merges cleanly too") {
        ReplicaStore restarted("actor-b");
        REQUIRE(restarted.merge_incoming(b.save()).is_ok());
        REQUIRE(b.merge_incoming(restarted.save()).is_ok());
        REQUIRE(restarted.document() == b.document());
    }
}
