#include <gtest/gtest.h>
#include <random>
#include "bytepath/core/shake.hpp"

using Resources::ShakeConfig;
using Resources::ShakeGenerator;

class ShakeGeneratorTest : public ::testing::Test {
protected:
    ShakeConfig config;

    void SetUp() override {
        config.duration = 0.5f;
        config.frequency = 4.0f;
        config.amplitude = 2.0f;
    }
};

TEST_F(ShakeGeneratorTest, InactiveReturnsZero) {
    ShakeGenerator shake(config);
    Vector offset = shake.advance(0.125f);
    EXPECT_FLOAT_EQ(offset.x, 0.0f);
    EXPECT_FLOAT_EQ(offset.y, 0.0f);
    EXPECT_FALSE(shake.isShaking());
}

TEST_F(ShakeGeneratorTest, StartPrecomputesSamplesInRange) {
    ShakeGenerator shake(ShakeConfig{});
    std::mt19937 rng(42);
    shake.start(rng);

    EXPECT_TRUE(shake.isShaking());
    // 0.4 s at 60 Hz
    EXPECT_EQ(shake.getSamplesX().size(), 24u);
    EXPECT_EQ(shake.getSamplesY().size(), 24u);
    for (float s : shake.getSamplesX()) {
        EXPECT_GE(s, -1.0f);
        EXPECT_LE(s, 1.0f);
    }
}

TEST_F(ShakeGeneratorTest, BlendsSamplesAndDecays) {
    ShakeGenerator shake(config);
    shake.startWithSamples({1.0f, -1.0f}, {0.5f, 0.5f});

    // t = 0.125: s = 0.5, halfway between sample 0 and 1; decay = 0.75
    Vector offset = shake.advance(0.125f);
    EXPECT_FLOAT_EQ(offset.x, 0.0f);
    EXPECT_FLOAT_EQ(offset.y, 0.5f * 0.75f * 2.0f);
}

TEST_F(ShakeGeneratorTest, SamplesPastTheEndCountAsZero) {
    ShakeGenerator shake(config);
    shake.startWithSamples({1.0f}, {1.0f});

    // s = 0.5: blend of sample 0 (1) and missing sample 1 (0)
    Vector offset = shake.offsetAt(0.125f);
    EXPECT_FLOAT_EQ(offset.x, 0.5f * 0.75f * 2.0f);
}

TEST_F(ShakeGeneratorTest, StopsAfterDurationUntilRestarted) {
    ShakeGenerator shake(config);
    shake.startWithSamples({1.0f, 1.0f}, {1.0f, 1.0f});

    shake.advance(0.25f);
    shake.advance(0.25f);
    EXPECT_TRUE(shake.isShaking());

    Vector offset = shake.advance(0.125f);
    EXPECT_FLOAT_EQ(offset.x, 0.0f);
    EXPECT_FLOAT_EQ(offset.y, 0.0f);
    EXPECT_FALSE(shake.isShaking());

    offset = shake.advance(0.125f);
    EXPECT_FLOAT_EQ(offset.x, 0.0f);
    EXPECT_FALSE(shake.isShaking());

    std::mt19937 rng(7);
    shake.start(rng);
    EXPECT_TRUE(shake.isShaking());
    EXPECT_FLOAT_EQ(shake.time(), 0.0f);
}
