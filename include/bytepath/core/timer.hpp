/**
 * @file timer.hpp
 * @brief Countdown primitive used for spawn gates, cooldowns and timed animations
 */

#pragma once

#include <cstdint>

/**
 * @class Timer
 * @brief Accumulates time toward a duration and reports when it is reached
 *
 * One-shot timers clamp at their duration and stay finished until reset().
 * Repeating timers restart on the same tick they cross their duration; the
 * overshoot carries into the next period so elapsed() < duration() always
 * holds, and finished() is true only for the crossing tick.
 *
 * A non-positive duration finishes on every tick.
 */
class Timer {
public:
    Timer() = default;
    Timer(float durationSeconds, bool repeating);

    /**
     * @brief Advances the timer
     * @param delta Seconds to add
     */
    void tick(float delta);

    /**
     * @brief Clears elapsed time and the finished flag. count() is preserved.
     */
    void reset();

    bool finished() const { return finishedFlag; }
    bool repeating() const { return repeatingFlag; }
    float elapsed() const { return elapsedSeconds; }
    float duration() const { return durationSeconds; }

    /**
     * @brief Number of times the timer has finished since construction
     */
    std::uint32_t count() const { return finishCount; }

    /**
     * @brief Fraction of the period elapsed, in [0,1]
     */
    float percent() const;

    void setDuration(float seconds) { durationSeconds = seconds; }
    void setRepeating(bool value) { repeatingFlag = value; }

private:
    float elapsedSeconds = 0.0f;
    float durationSeconds = 0.0f;
    std::uint32_t finishCount = 0;
    bool finishedFlag = false;
    bool repeatingFlag = false;
};
