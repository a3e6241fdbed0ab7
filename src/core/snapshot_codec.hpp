#pragma once

#include "core/change_log.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace sketchsync::codec {

/**
 * Snapshot wire format.
 *
 * Header:
 * - Magic (2 bytes): 0x53 0x4B ("SK")
 * - Version (1 byte)
 * - Kind (1 byte)
 * - Length (4 bytes, big-endian)
 *
 * Payload (Kind::Snapshot): u32 change count followed by the changes in
 * canonical order. Integers are big-endian, doubles are IEEE 754 bit
 * patterns, strings are u32 length + UTF-8 bytes.
 */
struct SnapshotHeader {
    static constexpr uint8_t MAGIC[2] = {0x53, 0x4B};  // "SK"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 8;

    enum class Kind : uint8_t {
        Snapshot = 0x01
    };

    Kind kind = Kind::Snapshot;
    uint32_t length = 0;
};

[[nodiscard]] std::vector<uint8_t> serialize_header(const SnapshotHeader& header);
[[nodiscard]] Result<SnapshotHeader, Error> deserialize_header(std::span<const uint8_t> data);

/**
 * Encode the full causal history of a log.
 */
[[nodiscard]] std::vector<uint8_t> encode_snapshot(const crdt::ChangeLog& log);

/**
 * Decode and validate a snapshot. Never partially succeeds.
 */
[[nodiscard]] Result<crdt::ChangeLog, Error> decode_snapshot(std::span<const uint8_t> data);

} // namespace sketchsync::codec
