/**
 * @file interpolation.hpp
 * @brief Time-driven tween between (begin, end) value pairs
 */

#pragma once

#include <utility>
#include <vector>
#include "bytepath/math/easing.hpp"

namespace Components {

/**
 * @brief Output of one Interpolation::eval step
 */
struct InterpolationResult {
    std::vector<float> values;  ///< One blended value per (begin, end) pair
    bool finished = false;      ///< True only on the step that reached the duration
};

/**
 * @struct Interpolation
 * @brief Tweens a set of (begin, end) pairs over a duration
 *
 * Each eval() advances time and returns (1-t)*begin + t*end per pair, where
 * t = ease(time / duration) with progress clamped to [0,1]. The step that
 * first reaches the duration reports finished; a repeating interpolation
 * rewinds to 0 on that same step, a one-shot one holds its end values.
 *
 * A non-positive duration is always finished and yields the end values.
 */
struct Interpolation {
    float time = 0.0f;
    float duration = 0.0f;
    std::vector<std::pair<float, float>> beginEnd;
    bool repeating = false;
    Easing::Curve easing = Easing::Curve::Linear;

    Interpolation() = default;
    Interpolation(float duration,
                  std::vector<std::pair<float, float>> beginEnd,
                  Easing::Curve easing = Easing::Curve::Linear,
                  bool repeating = false);

    /**
     * @brief Advances by delta using the stored easing curve
     */
    InterpolationResult eval(float delta);

    /**
     * @brief Advances by delta using an explicit easing curve
     */
    InterpolationResult eval(float delta, Easing::Curve curve);

    /**
     * @brief Normalized progress in [0,1]
     */
    float progress() const;
};

} // namespace Components
