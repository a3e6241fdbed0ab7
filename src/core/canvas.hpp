#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sketchsync::canvas {

inline constexpr std::string_view DEFAULT_TITLE = "Untitled Sketch";

struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point&) const = default;
};

/**
 * Stroke - A freehand polyline. Immutable after creation.
 */
struct Stroke {
    std::string id;
    ActorId creator;
    Timestamp timestamp;
    std::vector<Point> points;  // at least one
    std::string color;
    int width = 1;              // positive

    bool operator==(const Stroke&) const = default;
};

/**
 * Note - A sticky note. Only text and timestamp change after creation.
 */
struct Note {
    std::string id;
    ActorId creator;
    Timestamp timestamp;
    std::string text;
    Point position;
    std::string color;

    bool operator==(const Note&) const = default;
};

/**
 * CanvasElement - Sum type of everything that can be placed on the canvas.
 */
using CanvasElement = std::variant<Stroke, Note>;

enum class ElementType {
    Stroke,
    Note
};

/**
 * Cursor - Ephemeral presence record of one actor.
 */
struct Cursor {
    Point position;
    Timestamp last_active;

    bool operator==(const Cursor&) const = default;
};

struct Canvas {
    std::vector<CanvasElement> elements;
    std::map<ActorId, Cursor> cursors;
    std::string title{DEFAULT_TITLE};

    bool operator==(const Canvas&) const = default;
};

/**
 * Document - The materialized replica state.
 *
 * A document without a canvas is degraded and has to be repaired before
 * it is handed to consumers or mutated.
 */
struct Document {
    std::optional<Canvas> canvas;

    bool operator==(const Document&) const = default;
};

[[nodiscard]] Canvas make_default_canvas();

[[nodiscard]] inline bool has_canvas(const Document& doc) {
    return doc.canvas.has_value();
}

[[nodiscard]] constexpr ElementType get_type(const CanvasElement& element) {
    return std::visit([](const auto& e) -> ElementType {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Stroke>) return ElementType::Stroke;
        else if constexpr (std::is_same_v<T, Note>) return ElementType::Note;
    }, element);
}

[[nodiscard]] constexpr std::string_view type_name(ElementType type) {
    switch (type) {
        case ElementType::Stroke: return "stroke";
        case ElementType::Note: return "note";
    }
    return "unknown";
}

[[nodiscard]] const std::string& element_id(const CanvasElement& element);
[[nodiscard]] const ActorId& element_creator(const CanvasElement& element);
[[nodiscard]] Timestamp element_timestamp(const CanvasElement& element);

/**
 * Find a note by id. Elements with the same id but another type are skipped.
 */
[[nodiscard]] const Note* find_note(const Canvas& canvas, std::string_view id);
[[nodiscard]] Note* find_note(Canvas& canvas, std::string_view id);

/**
 * Render data in document order.
 */
[[nodiscard]] std::vector<const Stroke*> strokes(const Canvas& canvas);
[[nodiscard]] std::vector<const Note*> notes(const Canvas& canvas);

[[nodiscard]] bool is_finite(const Point& p);

/**
 * Structural checks shared by local mutations and decoded remote operations.
 */
[[nodiscard]] std::optional<std::string> validate_element(const CanvasElement& element);

} // namespace sketchsync::canvas
