#include "bytepath/core/timer.hpp"
#include <algorithm>

Timer::Timer(float durationSeconds, bool repeating)
    : durationSeconds(durationSeconds)
    , repeatingFlag(repeating)
{
}

void Timer::tick(float delta) {
    if (durationSeconds <= 0.0f) {
        // Degenerate timer: every tick is a completed period
        elapsedSeconds = 0.0f;
        if (repeatingFlag || !finishedFlag) {
            ++finishCount;
        }
        finishedFlag = true;
        return;
    }

    if (finishedFlag) {
        if (!repeatingFlag) {
            return;
        }
        // Repeating timers only report finished for the crossing tick
        finishedFlag = false;
    }

    elapsedSeconds += delta;
    if (elapsedSeconds < durationSeconds) {
        return;
    }

    finishedFlag = true;
    ++finishCount;
    if (repeatingFlag) {
        elapsedSeconds -= durationSeconds;
        // One tick reports at most one period; oversized deltas drop the rest
        if (elapsedSeconds >= durationSeconds) {
            elapsedSeconds = 0.0f;
        }
    } else {
        elapsedSeconds = durationSeconds;
    }
}

void Timer::reset() {
    elapsedSeconds = 0.0f;
    finishedFlag = false;
}

float Timer::percent() const {
    if (durationSeconds <= 0.0f) {
        return 1.0f;
    }
    return std::clamp(elapsedSeconds / durationSeconds, 0.0f, 1.0f);
}
