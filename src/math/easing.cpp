#include "bytepath/math/easing.hpp"
#include "bytepath/core/constants.hpp"
#include <cmath>

namespace Easing {

float linear(float t) {
    return t;
}

float easeInSine(float t) {
    return 1.0f - std::cos((t * GameConstants::Pi) / 2.0f);
}

float easeOutSine(float t) {
    return std::sin((t * GameConstants::Pi) / 2.0f);
}

float easeOutCubic(float t) {
    float const inv = 1.0f - t;
    return 1.0f - inv * inv * inv;
}

float easeInOutCubic(float t) {
    if (t < 0.5f) {
        return 4.0f * t * t * t;
    }
    float const p = -2.0f * t + 2.0f;
    return 1.0f - (p * p * p) / 2.0f;
}

float ease(Curve curve, float t) {
    switch (curve) {
        case Curve::Linear:         return linear(t);
        case Curve::EaseInSine:     return easeInSine(t);
        case Curve::EaseOutSine:    return easeOutSine(t);
        case Curve::EaseOutCubic:   return easeOutCubic(t);
        case Curve::EaseInOutCubic: return easeInOutCubic(t);
    }
    return t;
}

std::string getCurveName(Curve curve) {
    switch (curve) {
        case Curve::Linear:         return "LINEAR";
        case Curve::EaseInSine:     return "EASE_IN_SINE";
        case Curve::EaseOutSine:    return "EASE_OUT_SINE";
        case Curve::EaseOutCubic:   return "EASE_OUT_CUBIC";
        case Curve::EaseInOutCubic: return "EASE_IN_OUT_CUBIC";
        default: return "UNKNOWN";
    }
}

} // namespace Easing
