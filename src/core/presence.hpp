#pragma once

#include "core/canvas.hpp"
#include "core/types.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace sketchsync::presence {

inline constexpr std::chrono::milliseconds LIVENESS_WINDOW{10'000};

struct LiveCursor {
    ActorId actor;
    canvas::Point position;
    Timestamp last_active;
    std::string label;

    bool operator==(const LiveCursor&) const = default;
};

/**
 * Cursors of other actors that were active within the window, ordered by
 * actor id. An entry exactly window old is already stale.
 */
[[nodiscard]] std::vector<LiveCursor> live_cursors(const std::map<ActorId, canvas::Cursor>& cursors,
                                                   const ActorId& self,
                                                   Timestamp now,
                                                   std::chrono::milliseconds window = LIVENESS_WINDOW);

[[nodiscard]] std::vector<LiveCursor> live_cursors(const canvas::Document& doc,
                                                   const ActorId& self,
                                                   Timestamp now,
                                                   std::chrono::milliseconds window = LIVENESS_WINDOW);

/**
 * Short display label, "User " followed by the first four characters.
 */
[[nodiscard]] std::string cursor_label(const ActorId& actor);

} // namespace sketchsync::presence
