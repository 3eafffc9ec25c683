/**
 * @file time_dilation.hpp
 * @brief Slow-motion window applied to simulation time after a player death
 */

#pragma once

#include <optional>

namespace Resources {

/**
 * @class TimeDilation
 * @brief Converts raw step time into scaled step time
 *
 * A death opens a window of `windowSeconds` raw seconds. Inside it the
 * scaled delta is raw * ((1-e)*minimumSpeed + e), with e the in-out cubic
 * easing of the window progress, so time ramps from 15% back up to full
 * speed. Outside the window scaled == raw.
 */
class TimeDilation {
public:
    static constexpr float DefaultWindowSeconds = 2.5f;
    static constexpr float DefaultMinimumSpeed = 0.15f;

    TimeDilation() = default;
    TimeDilation(float windowSeconds, float minimumSpeed);

    /**
     * @brief Advances the slow-motion window and returns the scaled delta
     * @param rawDelta Wall-clock step duration in seconds
     * @param deathOccurred Whether a PlayerDeath was observed since the last call
     */
    float advance(float rawDelta, bool deathOccurred);

    bool active() const { return slowDownTimer.has_value(); }

    /**
     * @brief Raw seconds spent inside the current window, if one is open
     */
    std::optional<float> elapsed() const { return slowDownTimer; }

    float windowSeconds() const { return window; }

private:
    std::optional<float> slowDownTimer;
    float window = DefaultWindowSeconds;
    float minimumSpeed = DefaultMinimumSpeed;
};

} // namespace Resources
