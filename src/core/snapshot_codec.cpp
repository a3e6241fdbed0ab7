#include "core/snapshot_codec.hpp"

#include <bit>
#include <string>

namespace sketchsync::codec {

namespace {

enum class OpTag : uint8_t {
    MakeCanvas = 1,
    SetTitle = 2,
    InsertElement = 3,
    SetNoteText = 4,
    SetCursor = 5
};

enum class ElementTag : uint8_t {
    Stroke = 1,
    Note = 2
};

class ByteWriter {
public:
    void u8(uint8_t v) { out_.push_back(v); }

    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void i64(int64_t v) { u64(static_cast<uint64_t>(v)); }
    void f64(double v) { u64(std::bit_cast<uint64_t>(v)); }

    void str(const std::string& s) {
        u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    [[nodiscard]] std::vector<uint8_t> take() { return std::move(out_); }

private:
    std::vector<uint8_t> out_;
};

// Reads past the end set a sticky failure flag and yield zero values; the
// caller checks failed() at structural boundaries.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    uint8_t u8() {
        if (!need(1)) return 0;
        return data_[pos_++];
    }

    uint32_t u32() {
        if (!need(4)) return 0;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | data_[pos_++];
        return v;
    }

    uint64_t u64() {
        if (!need(8)) return 0;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | data_[pos_++];
        return v;
    }

    int64_t i64() { return static_cast<int64_t>(u64()); }
    double f64() { return std::bit_cast<double>(u64()); }

    std::string str() {
        const uint32_t len = u32();
        if (!need(len)) return {};
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    /**
     * Read an element count, rejecting counts that cannot fit in the
     * remaining bytes at min_item_size each.
     */
    uint32_t count(size_t min_item_size) {
        const uint32_t n = u32();
        if (!failed_ && static_cast<uint64_t>(n) * min_item_size > remaining()) {
            failed_ = true;
            return 0;
        }
        return n;
    }

    [[nodiscard]] bool failed() const { return failed_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

private:
    bool need(size_t n) {
        if (failed_ || remaining() < n) {
            failed_ = true;
            return false;
        }
        return true;
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
    bool failed_ = false;
};

void write_point(ByteWriter& w, const canvas::Point& p) {
    w.f64(p.x);
    w.f64(p.y);
}

canvas::Point read_point(ByteReader& r) {
    canvas::Point p;
    p.x = r.f64();
    p.y = r.f64();
    return p;
}

void write_element(ByteWriter& w, const canvas::CanvasElement& element) {
    std::visit([&w](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, canvas::Stroke>) {
            w.u8(static_cast<uint8_t>(ElementTag::Stroke));
            w.str(e.id);
            w.str(e.creator);
            w.i64(e.timestamp.millis());
            w.u32(static_cast<uint32_t>(e.points.size()));
            for (const auto& p : e.points) write_point(w, p);
            w.str(e.color);
            w.u32(static_cast<uint32_t>(e.width));
        } else if constexpr (std::is_same_v<T, canvas::Note>) {
            w.u8(static_cast<uint8_t>(ElementTag::Note));
            w.str(e.id);
            w.str(e.creator);
            w.i64(e.timestamp.millis());
            w.str(e.text);
            write_point(w, e.position);
            w.str(e.color);
        }
    }, element);
}

Result<canvas::CanvasElement, Error> read_element(ByteReader& r) {
    const auto tag = static_cast<ElementTag>(r.u8());
    switch (tag) {
        case ElementTag::Stroke: {
            canvas::Stroke stroke;
            stroke.id = r.str();
            stroke.creator = r.str();
            stroke.timestamp = Timestamp(r.i64());
            const uint32_t n = r.count(16);
            stroke.points.reserve(n);
            for (uint32_t i = 0; i < n && !r.failed(); ++i) {
                stroke.points.push_back(read_point(r));
            }
            stroke.color = r.str();
            stroke.width = static_cast<int>(static_cast<int32_t>(r.u32()));
            return Result<canvas::CanvasElement, Error>::ok(std::move(stroke));
        }
        case ElementTag::Note: {
            canvas::Note note;
            note.id = r.str();
            note.creator = r.str();
            note.timestamp = Timestamp(r.i64());
            note.text = r.str();
            note.position = read_point(r);
            note.color = r.str();
            return Result<canvas::CanvasElement, Error>::ok(std::move(note));
        }
    }
    return Result<canvas::CanvasElement, Error>::err(
        Error{"Unknown element tag " + std::to_string(static_cast<int>(tag)), ErrorCode::DecodeFailed});
}

void write_operation(ByteWriter& w, const crdt::Operation& op) {
    std::visit([&w](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, crdt::ops::MakeCanvas>) {
            w.u8(static_cast<uint8_t>(OpTag::MakeCanvas));
        } else if constexpr (std::is_same_v<T, crdt::ops::SetTitle>) {
            w.u8(static_cast<uint8_t>(OpTag::SetTitle));
            w.str(o.title);
        } else if constexpr (std::is_same_v<T, crdt::ops::InsertElement>) {
            w.u8(static_cast<uint8_t>(OpTag::InsertElement));
            write_element(w, o.element);
        } else if constexpr (std::is_same_v<T, crdt::ops::SetNoteText>) {
            w.u8(static_cast<uint8_t>(OpTag::SetNoteText));
            w.str(o.element_id);
            w.str(o.text);
            w.i64(o.timestamp.millis());
        } else if constexpr (std::is_same_v<T, crdt::ops::SetCursor>) {
            w.u8(static_cast<uint8_t>(OpTag::SetCursor));
            w.str(o.actor);
            write_point(w, o.position);
            w.i64(o.last_active.millis());
        }
    }, op);
}

Result<crdt::Operation, Error> read_operation(ByteReader& r) {
    const auto tag = static_cast<OpTag>(r.u8());
    switch (tag) {
        case OpTag::MakeCanvas:
            return Result<crdt::Operation, Error>::ok(crdt::ops::MakeCanvas{});
        case OpTag::SetTitle:
            return Result<crdt::Operation, Error>::ok(crdt::ops::SetTitle{r.str()});
        case OpTag::InsertElement: {
            auto element = read_element(r);
            if (element.is_err()) {
                return Result<crdt::Operation, Error>::err(element.unwrap_err());
            }
            return Result<crdt::Operation, Error>::ok(
                crdt::ops::InsertElement{std::move(element).unwrap()});
        }
        case OpTag::SetNoteText: {
            crdt::ops::SetNoteText o;
            o.element_id = r.str();
            o.text = r.str();
            o.timestamp = Timestamp(r.i64());
            return Result<crdt::Operation, Error>::ok(std::move(o));
        }
        case OpTag::SetCursor: {
            crdt::ops::SetCursor o;
            o.actor = r.str();
            o.position = read_point(r);
            o.last_active = Timestamp(r.i64());
            return Result<crdt::Operation, Error>::ok(std::move(o));
        }
    }
    return Result<crdt::Operation, Error>::err(
        Error{"Unknown operation tag " + std::to_string(static_cast<int>(tag)), ErrorCode::DecodeFailed});
}

Error truncated() {
    return Error{"Snapshot payload truncated", ErrorCode::DecodeFailed};
}

} // namespace

std::vector<uint8_t> serialize_header(const SnapshotHeader& header) {
    std::vector<uint8_t> data(SnapshotHeader::HEADER_SIZE);

    data[0] = SnapshotHeader::MAGIC[0];
    data[1] = SnapshotHeader::MAGIC[1];
    data[2] = SnapshotHeader::VERSION;
    data[3] = static_cast<uint8_t>(header.kind);
    data[4] = (header.length >> 24) & 0xFF;
    data[5] = (header.length >> 16) & 0xFF;
    data[6] = (header.length >> 8) & 0xFF;
    data[7] = header.length & 0xFF;

    return data;
}

Result<SnapshotHeader, Error> deserialize_header(std::span<const uint8_t> data) {
    if (data.size() < SnapshotHeader::HEADER_SIZE) {
        return Result<SnapshotHeader, Error>::err(Error{"Header too short", ErrorCode::DecodeFailed});
    }

    if (data[0] != SnapshotHeader::MAGIC[0] || data[1] != SnapshotHeader::MAGIC[1]) {
        return Result<SnapshotHeader, Error>::err(Error{"Invalid magic", ErrorCode::DecodeFailed});
    }

    if (data[2] != SnapshotHeader::VERSION) {
        return Result<SnapshotHeader, Error>::err(Error{"Unsupported version", ErrorCode::DecodeFailed});
    }

    if (data[3] != static_cast<uint8_t>(SnapshotHeader::Kind::Snapshot)) {
        return Result<SnapshotHeader, Error>::err(Error{"Unknown payload kind", ErrorCode::DecodeFailed});
    }

    SnapshotHeader header;
    header.kind = static_cast<SnapshotHeader::Kind>(data[3]);
    header.length = (static_cast<uint32_t>(data[4]) << 24) |
                    (static_cast<uint32_t>(data[5]) << 16) |
                    (static_cast<uint32_t>(data[6]) << 8) |
                    static_cast<uint32_t>(data[7]);

    return Result<SnapshotHeader, Error>::ok(header);
}

std::vector<uint8_t> encode_snapshot(const crdt::ChangeLog& log) {
    ByteWriter w;
    const auto changes = log.changes();
    w.u32(static_cast<uint32_t>(changes.size()));
    for (const auto& change : changes) {
        w.str(change.actor);
        w.u64(change.seq);
        w.u64(change.start_op);
        w.i64(change.timestamp.millis());
        w.u32(static_cast<uint32_t>(change.deps.size()));
        for (const auto& [actor, seq] : change.deps) {
            w.str(actor);
            w.u64(seq);
        }
        w.u32(static_cast<uint32_t>(change.ops.size()));
        for (const auto& op : change.ops) {
            write_operation(w, op);
        }
    }
    auto payload = w.take();

    SnapshotHeader header;
    header.length = static_cast<uint32_t>(payload.size());
    auto out = serialize_header(header);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

Result<crdt::ChangeLog, Error> decode_snapshot(std::span<const uint8_t> data) {
    auto header_result = deserialize_header(data);
    if (header_result.is_err()) {
        return Result<crdt::ChangeLog, Error>::err(header_result.unwrap_err());
    }
    const auto header = header_result.unwrap();
    const auto body = data.subspan(SnapshotHeader::HEADER_SIZE);
    if (body.size() != header.length) {
        return Result<crdt::ChangeLog, Error>::err(
            Error{"Snapshot length mismatch", ErrorCode::DecodeFailed});
    }

    ByteReader r(body);
    // Smallest change: empty actor, seq, start_op, timestamp, two counts.
    const uint32_t change_count = r.count(4 + 8 + 8 + 8 + 4 + 4);
    if (r.failed()) {
        return Result<crdt::ChangeLog, Error>::err(truncated());
    }

    std::vector<crdt::Change> changes;
    changes.reserve(change_count);
    for (uint32_t c = 0; c < change_count; ++c) {
        crdt::Change change;
        change.actor = r.str();
        change.seq = r.u64();
        change.start_op = r.u64();
        change.timestamp = Timestamp(r.i64());

        const uint32_t dep_count = r.count(4 + 8);
        for (uint32_t i = 0; i < dep_count && !r.failed(); ++i) {
            auto actor = r.str();
            const auto seq = r.u64();
            if (!change.deps.emplace(std::move(actor), seq).second) {
                return Result<crdt::ChangeLog, Error>::err(
                    Error{"Duplicate dependency entry", ErrorCode::DecodeFailed});
            }
        }

        const uint32_t op_count = r.count(1);
        change.ops.reserve(op_count);
        for (uint32_t i = 0; i < op_count && !r.failed(); ++i) {
            auto op = read_operation(r);
            if (op.is_err()) {
                return Result<crdt::ChangeLog, Error>::err(op.unwrap_err());
            }
            change.ops.push_back(std::move(op).unwrap());
        }

        if (r.failed()) {
            return Result<crdt::ChangeLog, Error>::err(truncated());
        }
        changes.push_back(std::move(change));
    }

    if (r.remaining() != 0) {
        return Result<crdt::ChangeLog, Error>::err(
            Error{"Trailing bytes after snapshot", ErrorCode::DecodeFailed});
    }

    return crdt::ChangeLog::from_changes(std::move(changes));
}

} // namespace sketchsync::codec
