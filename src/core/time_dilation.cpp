#include "bytepath/core/time_dilation.hpp"
#include "bytepath/math/easing.hpp"

namespace Resources {

TimeDilation::TimeDilation(float windowSeconds, float minimumSpeed)
    : window(windowSeconds)
    , minimumSpeed(minimumSpeed)
{
}

float TimeDilation::advance(float rawDelta, bool deathOccurred) {
    if (deathOccurred) {
        slowDownTimer = 0.0f;
    }
    if (!slowDownTimer) {
        return rawDelta;
    }

    *slowDownTimer += rawDelta;
    if (window > 0.0f && *slowDownTimer <= window) {
        float const easing = Easing::easeInOutCubic(*slowDownTimer / window);
        float const slowAmount = (1.0f - easing) * minimumSpeed + easing * 1.0f;
        return rawDelta * slowAmount;
    }

    slowDownTimer.reset();
    return rawDelta;
}

} // namespace Resources
