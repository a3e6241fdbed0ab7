#include <catch2/catch_test_macros.hpp>
#include "core/snapshot_codec.hpp"

using namespace sketchsync;
using namespace sketchsync::codec;

namespace {

crdt::ChangeLog sample_log() {
    crdt::ChangeLog log;
    REQUIRE(log.append_local("actor-a", {crdt::ops::MakeCanvas{}, crdt::ops::SetTitle{"Plan"}},
                             Timestamp(100)).is_ok());
    REQUIRE(log.append_local("actor-a", {crdt::ops::InsertElement{canvas::Stroke{
        .id = "s1",
        .creator = "actor-a",
        .timestamp = Timestamp(110),
        .points = {{0.5, -1.25}, {3, 4}},
        .color = "#112233",
        .width = 4
    }}}, Timestamp(110)).is_ok());
    REQUIRE(log.append_local("actor-a", {crdt::ops::InsertElement{canvas::Note{
        .id = "n1",
        .creator = "actor-a",
        .timestamp = Timestamp(120),
        .text = "caf\xC3\xA9",
        .position = {7, 8},
        .color = "#fef08a"
    }}}, Timestamp(120)).is_ok());
    REQUIRE(log.append_local("actor-a", {crdt::ops::SetNoteText{"n1", "updated", Timestamp(130)},
                                         crdt::ops::SetCursor{"actor-a", {1, 2}, Timestamp(130)}},
                             Timestamp(130)).is_ok());
    return log;
}

} // namespace

TEST_CASE("Snapshot header serialization", "[codec]") {
    SnapshotHeader header;
    header.length = 0x01020304;

    auto bytes = serialize_header(header);
    REQUIRE(bytes.size() == SnapshotHeader::HEADER_SIZE);
    REQUIRE(bytes[0] == 'S');
    REQUIRE(bytes[1] == 'K');
    REQUIRE(bytes[2] == SnapshotHeader::VERSION);
    REQUIRE(bytes[4] == 0x01);
    REQUIRE(bytes[7] == 0x04);

    auto parsed = deserialize_header(bytes);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().length == 0x01020304);

    SECTION("bad magic") {
        bytes[0] = 'X';
        REQUIRE(deserialize_header(bytes).unwrap_err().is(ErrorCode::DecodeFailed));
    }

    SECTION("unsupported version") {
        bytes[2] = 99;
        REQUIRE(deserialize_header(bytes).is_err());
    }

    SECTION("too short") {
        bytes.resize(5);
        REQUIRE(deserialize_header(bytes).is_err());
    }
}

TEST_CASE("Encoded history decodes to the same document", "[codec]") {
    auto log = sample_log();
    auto bytes = encode_snapshot(log);

    auto decoded = decode_snapshot(bytes);
    REQUIRE(decoded.is_ok());
    const auto& restored = decoded.unwrap();

    REQUIRE(restored.changes() == log.changes());
    REQUIRE(restored.document() == log.document());
    REQUIRE(restored.document().canvas->title == "Plan");
    REQUIRE(canvas::find_note(*restored.document().canvas, "n1")->text == "updated");
}

TEST_CASE("An empty history is a valid snapshot", "[codec]") {
    crdt::ChangeLog empty;
    auto decoded = decode_snapshot(encode_snapshot(empty));

    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().empty());
    REQUIRE_FALSE(decoded.unwrap().has_canvas());
}

TEST_CASE("Corrupt snapshots are rejected", "[codec]") {
    auto bytes = encode_snapshot(sample_log());

    SECTION("garbage") {
        std::vector<uint8_t> garbage{0xde, 0xad, 0xbe, 0xef};
        REQUIRE(decode_snapshot(garbage).unwrap_err().is(ErrorCode::DecodeFailed));
    }

    SECTION("truncated payload") {
        bytes.pop_back();
        REQUIRE(decode_snapshot(bytes).is_err());
    }

    SECTION("trailing bytes") {
        bytes.push_back(0);
        REQUIRE(decode_snapshot(bytes).is_err());
    }

    SECTION("every prefix fails cleanly") {
        for (size_t len = 0; len < bytes.size(); ++len) {
            std::span<const uint8_t> prefix(bytes.data(), len);
            REQUIRE(decode_snapshot(prefix).is_err());
        }
    }
}
