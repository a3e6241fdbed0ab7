#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>

namespace sketchsync::network {

/**
 * ReconnectPolicy - Delay before each reconnect attempt after an abnormal close.
 *
 * The defaults retry every 5 seconds forever. multiplier > 1 gives
 * exponential backoff capped at max_delay; max_attempts = 0 means unlimited.
 */
struct ReconnectPolicy {
    std::chrono::milliseconds initial_delay{5000};
    double multiplier = 1.0;
    std::chrono::milliseconds max_delay{60000};
    int max_attempts = 0;

    /**
     * Delay for the given 1-based attempt, or nullopt once attempts are used up.
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> delay_for_attempt(int attempt) const {
        if (attempt < 1) {
            return std::nullopt;
        }
        if (max_attempts > 0 && attempt > max_attempts) {
            return std::nullopt;
        }

        const auto initial = std::max<std::chrono::milliseconds::rep>(0, initial_delay.count());
        const auto cap = std::max<std::chrono::milliseconds::rep>(initial, max_delay.count());
        if (multiplier <= 1.0) {
            return std::chrono::milliseconds(initial);
        }

        const double scaled = static_cast<double>(initial) * std::pow(multiplier, attempt - 1);
        if (!std::isfinite(scaled) || scaled >= static_cast<double>(cap)) {
            return std::chrono::milliseconds(cap);
        }
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
    }
};

} // namespace sketchsync::network
