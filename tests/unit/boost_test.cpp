#include <gtest/gtest.h>
#include "bytepath/systems/boost.hpp"
#include "bytepath/systems/player_spawn.hpp"
#include "bytepath/components/basic.hpp"

using namespace Systems;

class BoostSystemTest : public ::testing::Test {
protected:
    entt::registry registry;
    GameContext ctx;
    BoostSystem system;
    entt::entity player = entt::null;

    void SetUp() override {
        system.setGameConfig(ctx.config);
        system.setup(registry, ctx);
        player = registry.create();
        emplacePlayer(registry, player, Vector(240.0f, 135.0f), ShipConfig{});
    }

    void stepFor(float seconds, float dt = 0.0625f) {
        ctx.time.raw = dt;
        ctx.time.scaled = dt;
        for (float t = 0.0f; t < seconds; t += dt) {
            system.update(registry, ctx);
        }
    }

    Components::Boost& boost() { return registry.get<Components::Boost>(player); }
    Components::Velocity& velocity() { return registry.get<Components::Velocity>(player); }
};

TEST_F(BoostSystemTest, HoldingBoostDrainsAndSpeedsUp) {
    ctx.keys.insert(ctx.config.Keys.boost);
    stepFor(1.0f);

    EXPECT_FLOAT_EQ(boost().current, 100.0f - 50.0f * 1.0f);
    EXPECT_TRUE(boost().boosting);
    EXPECT_FLOAT_EQ(velocity().current, velocity().base * 1.5f);
}

TEST_F(BoostSystemTest, ReleasingRegeneratesClampedToMax) {
    ctx.keys.insert(ctx.config.Keys.boost);
    stepFor(1.0f);
    ctx.keys.clear();
    stepFor(2.0f);

    EXPECT_FLOAT_EQ(boost().current, 50.0f + 10.0f * 2.0f);
    EXPECT_FALSE(boost().boosting);
    EXPECT_FLOAT_EQ(velocity().current, velocity().base);

    stepFor(10.0f);
    EXPECT_FLOAT_EQ(boost().current, 100.0f);
}

TEST_F(BoostSystemTest, EmptyTankStartsCooldown) {
    ctx.keys.insert(ctx.config.Keys.boost);
    stepFor(2.0f);

    ASSERT_TRUE(boost().cooldown.has_value());
    EXPECT_FALSE(boost().canBoost());
    EXPECT_FLOAT_EQ(boost().current, 0.0f);

    // Still holding: no boosting until the cooldown has fully elapsed
    stepFor(1.0f);
    EXPECT_FALSE(boost().boosting);
    EXPECT_FLOAT_EQ(velocity().current, velocity().base);

    stepFor(1.0f);
    EXPECT_FALSE(boost().cooldown.has_value());
    EXPECT_TRUE(boost().boosting);
}

TEST_F(BoostSystemTest, SlowKeyHalvesSpeed) {
    ctx.keys.insert(ctx.config.Keys.slow);
    stepFor(0.0625f);
    EXPECT_FLOAT_EQ(velocity().current, velocity().base * 0.5f);

    ctx.keys.clear();
    stepFor(0.0625f);
    EXPECT_FLOAT_EQ(velocity().current, velocity().base);
}

TEST_F(BoostSystemTest, NoPlayerIsANoOp) {
    registry.destroy(player);
    ctx.keys.insert(ctx.config.Keys.boost);
    EXPECT_NO_THROW(stepFor(0.5f));
}
