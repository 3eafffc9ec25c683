#include "bytepath/core/interpolation.hpp"
#include <algorithm>

namespace Components {

Interpolation::Interpolation(float duration,
                             std::vector<std::pair<float, float>> beginEnd,
                             Easing::Curve easing,
                             bool repeating)
    : duration(duration)
    , beginEnd(std::move(beginEnd))
    , repeating(repeating)
    , easing(easing)
{
}

InterpolationResult Interpolation::eval(float delta) {
    return eval(delta, easing);
}

InterpolationResult Interpolation::eval(float delta, Easing::Curve curve) {
    InterpolationResult result;
    result.values.reserve(beginEnd.size());

    float const previous = time;
    time += delta;

    float t = 1.0f;
    if (duration > 0.0f) {
        t = Easing::ease(curve, std::clamp(time / duration, 0.0f, 1.0f));
        result.finished = previous < duration && time >= duration;
    } else {
        result.finished = true;
    }

    for (const auto& [begin, end] : beginEnd) {
        result.values.push_back((1.0f - t) * begin + t * end);
    }

    if (result.finished && repeating) {
        time = 0.0f;
    }
    return result;
}

float Interpolation::progress() const {
    if (duration <= 0.0f) {
        return 1.0f;
    }
    return std::clamp(time / duration, 0.0f, 1.0f);
}

} // namespace Components
