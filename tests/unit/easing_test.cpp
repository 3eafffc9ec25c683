#include <gtest/gtest.h>
#include "bytepath/math/easing.hpp"

using Easing::Curve;

TEST(EasingTest, EndpointsAreFixed) {
    for (auto curve : {Curve::Linear, Curve::EaseInSine, Curve::EaseOutSine,
                       Curve::EaseOutCubic, Curve::EaseInOutCubic}) {
        EXPECT_NEAR(Easing::ease(curve, 0.0f), 0.0f, 1e-6f) << Easing::getCurveName(curve);
        EXPECT_NEAR(Easing::ease(curve, 1.0f), 1.0f, 1e-6f) << Easing::getCurveName(curve);
    }
}

TEST(EasingTest, EaseInOutCubicBothHalves) {
    EXPECT_FLOAT_EQ(Easing::easeInOutCubic(0.25f), 4.0f * 0.25f * 0.25f * 0.25f);
    EXPECT_FLOAT_EQ(Easing::easeInOutCubic(0.5f), 0.5f);
    // 1 - (-2t + 2)^3 / 2 at t = 0.75 -> 1 - 0.125 / 2
    EXPECT_FLOAT_EQ(Easing::easeInOutCubic(0.75f), 0.9375f);
}

TEST(EasingTest, SineCurves) {
    EXPECT_NEAR(Easing::easeOutSine(0.5f), 0.70710678f, 1e-6f);
    EXPECT_NEAR(Easing::easeInSine(0.5f), 1.0f - 0.70710678f, 1e-6f);
}

TEST(EasingTest, EaseOutCubic) {
    EXPECT_FLOAT_EQ(Easing::easeOutCubic(0.5f), 0.875f);
}

TEST(EasingTest, DispatchMatchesFunctions) {
    EXPECT_FLOAT_EQ(Easing::ease(Curve::Linear, 0.3f), 0.3f);
    EXPECT_FLOAT_EQ(Easing::ease(Curve::EaseOutCubic, 0.3f), Easing::easeOutCubic(0.3f));
    EXPECT_FLOAT_EQ(Easing::ease(Curve::EaseInOutCubic, 0.3f), Easing::easeInOutCubic(0.3f));
    EXPECT_EQ(Easing::getCurveName(Curve::EaseInOutCubic), "EASE_IN_OUT_CUBIC");
}
