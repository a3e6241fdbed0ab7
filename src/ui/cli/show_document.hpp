#pragma once

#include "core/canvas.hpp"
#include "core/types.hpp"
#include <QString>

namespace sketchsync::ui {

struct ShowOptions {
    bool includeIds = false;
};

// Human readable summary: title, elements in document order, live cursors.
[[nodiscard]] QString format_document(const canvas::Document& doc,
                                      const ActorId& self,
                                      Timestamp now,
                                      const ShowOptions& options = {});

// JSON output:
// {
//   "title": "...",
//   "elements": [{ "type", "id"?, "creator", "timestamp", ... }],
//   "cursors": [{ "actorId", "label", "x", "y", "lastActive" }]
// }
// A degraded document renders as { "canvas": null }.
[[nodiscard]] QString format_document_json(const canvas::Document& doc,
                                           const ActorId& self,
                                           Timestamp now,
                                           const ShowOptions& options = {});

} // namespace sketchsync::ui
