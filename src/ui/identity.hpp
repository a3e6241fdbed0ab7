#pragma once

#include "core/types.hpp"
#include <QSettings>

namespace sketchsync::ui {

inline constexpr const char* SETTINGS_ACTOR_ID = "identity/actor_id";

/**
 * Actor id of this profile. Generated and written on first use, then
 * returned unchanged on every later call.
 */
[[nodiscard]] ActorId load_or_create_actor_id(QSettings& settings);

} // namespace sketchsync::ui
