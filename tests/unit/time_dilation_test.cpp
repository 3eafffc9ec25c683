#include <gtest/gtest.h>
#include "bytepath/core/time_dilation.hpp"
#include "bytepath/math/easing.hpp"

using Resources::TimeDilation;

TEST(TimeDilationTest, InactivePassesRawThrough) {
    TimeDilation dilation;
    EXPECT_FALSE(dilation.active());
    EXPECT_FLOAT_EQ(dilation.advance(0.015625f, false), 0.015625f);
}

TEST(TimeDilationTest, FirstStepAfterDeathIsSlow) {
    TimeDilation dilation(2.5f, 0.15f);
    float const raw = 0.015625f;
    float const scaled = dilation.advance(raw, true);
    float const easing = Easing::easeInOutCubic(raw / 2.5f);
    EXPECT_FLOAT_EQ(scaled, raw * ((1.0f - easing) * 0.15f + easing));
    EXPECT_TRUE(dilation.active());
}

TEST(TimeDilationTest, WindowSlowsThenReturnsToNormal) {
    TimeDilation dilation(2.5f, 0.15f);
    float const raw = 0.0625f;  // 40 steps = 2.5 s exactly

    float rawSum = 0.0f;
    float scaledSum = 0.0f;
    for (int i = 0; i < 40; ++i) {
        rawSum += raw;
        scaledSum += dilation.advance(raw, i == 0);
    }
    EXPECT_FLOAT_EQ(rawSum, 2.5f);
    EXPECT_LT(scaledSum, rawSum);

    // Past the window the timer is dropped and time runs at full speed
    EXPECT_FLOAT_EQ(dilation.advance(raw, false), raw);
    EXPECT_FALSE(dilation.active());
    EXPECT_FLOAT_EQ(dilation.advance(raw, false), raw);
}

TEST(TimeDilationTest, SecondDeathRestartsWindow) {
    TimeDilation dilation(2.5f, 0.15f);
    dilation.advance(1.0f, true);
    ASSERT_TRUE(dilation.elapsed().has_value());
    EXPECT_FLOAT_EQ(*dilation.elapsed(), 1.0f);

    dilation.advance(0.5f, true);
    EXPECT_FLOAT_EQ(*dilation.elapsed(), 0.5f);
}
