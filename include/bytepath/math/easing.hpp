/**
 * @file easing.hpp
 * @brief Named easing curves
 *
 * Each curve maps normalized progress [0,1] onto [0,1] with f(0)=0, f(1)=1.
 */

#pragma once

#include <string>

namespace Easing {

/**
 * @enum Curve
 * @brief Closed set of easing curves that components may store
 */
enum class Curve {
    Linear,
    EaseInSine,
    EaseOutSine,
    EaseOutCubic,
    EaseInOutCubic
};

/**
 * @brief Evaluates a curve at normalized progress t
 */
float ease(Curve curve, float t);

float linear(float t);
float easeInSine(float t);
float easeOutSine(float t);
float easeOutCubic(float t);

/**
 * @brief 4t^3 below the midpoint, 1 - (-2t+2)^3 / 2 above it
 */
float easeInOutCubic(float t);

std::string getCurveName(Curve curve);

} // namespace Easing
