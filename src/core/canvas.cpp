#include "core/canvas.hpp"

#include <algorithm>
#include <cmath>

namespace sketchsync::canvas {

Canvas make_default_canvas() {
    return Canvas{
        .elements = {},
        .cursors = {},
        .title = std::string(DEFAULT_TITLE)
    };
}

const std::string& element_id(const CanvasElement& element) {
    return std::visit([](const auto& e) -> const std::string& { return e.id; }, element);
}

const ActorId& element_creator(const CanvasElement& element) {
    return std::visit([](const auto& e) -> const ActorId& { return e.creator; }, element);
}

Timestamp element_timestamp(const CanvasElement& element) {
    return std::visit([](const auto& e) { return e.timestamp; }, element);
}

const Note* find_note(const Canvas& canvas, std::string_view id) {
    for (const auto& element : canvas.elements) {
        if (const auto* note = std::get_if<Note>(&element); note && note->id == id) {
            return note;
        }
    }
    return nullptr;
}

Note* find_note(Canvas& canvas, std::string_view id) {
    for (auto& element : canvas.elements) {
        if (auto* note = std::get_if<Note>(&element); note && note->id == id) {
            return note;
        }
    }
    return nullptr;
}

std::vector<const Stroke*> strokes(const Canvas& canvas) {
    std::vector<const Stroke*> out;
    for (const auto& element : canvas.elements) {
        if (const auto* stroke = std::get_if<Stroke>(&element)) {
            out.push_back(stroke);
        }
    }
    return out;
}

std::vector<const Note*> notes(const Canvas& canvas) {
    std::vector<const Note*> out;
    for (const auto& element : canvas.elements) {
        if (const auto* note = std::get_if<Note>(&element)) {
            out.push_back(note);
        }
    }
    return out;
}

bool is_finite(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

std::optional<std::string> validate_element(const CanvasElement& element) {
    if (element_id(element).empty()) {
        return std::string("element id is empty");
    }
    return std::visit([](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        if (!e.timestamp.in_range()) return std::string("element timestamp is out of range");
        if constexpr (std::is_same_v<T, Stroke>) {
            if (e.points.empty()) return std::string("stroke has no points");
            if (e.width <= 0) return std::string("stroke width must be positive");
            if (!std::all_of(e.points.begin(), e.points.end(), is_finite)) {
                return std::string("stroke has a non-finite point");
            }
        } else if constexpr (std::is_same_v<T, Note>) {
            if (!is_finite(e.position)) return std::string("note position is not finite");
        }
        return std::nullopt;
    }, element);
}

} // namespace sketchsync::canvas
