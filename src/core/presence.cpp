#include "core/presence.hpp"

namespace sketchsync::presence {

std::vector<LiveCursor> live_cursors(const std::map<ActorId, canvas::Cursor>& cursors,
                                     const ActorId& self,
                                     Timestamp now,
                                     std::chrono::milliseconds window) {
    // last_active may come from a peer and is never subtracted from.
    const Timestamp cutoff = now - window;
    std::vector<LiveCursor> out;
    for (const auto& [actor, cursor] : cursors) {
        if (actor == self) {
            continue;
        }
        if (cursor.last_active <= cutoff) {
            continue;
        }
        out.push_back(LiveCursor{actor, cursor.position, cursor.last_active, cursor_label(actor)});
    }
    return out;
}

std::vector<LiveCursor> live_cursors(const canvas::Document& doc,
                                     const ActorId& self,
                                     Timestamp now,
                                     std::chrono::milliseconds window) {
    if (!doc.canvas) {
        return {};
    }
    return live_cursors(doc.canvas->cursors, self, now, window);
}

std::string cursor_label(const ActorId& actor) {
    return "User " + actor.substr(0, 4);
}

} // namespace sketchsync::presence
