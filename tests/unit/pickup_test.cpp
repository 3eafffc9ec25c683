#include <gtest/gtest.h>
#include <initializer_list>
#include <cmath>
#include "bytepath/systems/pickup.hpp"
#include "bytepath/systems/pickup_capture.hpp"
#include "bytepath/systems/pickup_spawn.hpp"
#include "bytepath/systems/player_spawn.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"

using namespace Systems;

class PickupTest : public ::testing::Test {
protected:
    entt::registry registry;
    GameContext ctx;
    PickupSpawnSystem spawnSystem;
    PickupSystem pickupSystem;
    PickupCaptureSystem captureSystem;

    void SetUp() override {
        for (ISystem* system : std::initializer_list<ISystem*>{&spawnSystem, &pickupSystem, &captureSystem}) {
            system->setGameConfig(ctx.config);
            system->setup(registry, ctx);
        }
        ctx.time.raw = 0.0625f;
        ctx.time.scaled = 0.0625f;
    }

    entt::entity spawnPlayer(const Vector& at) {
        auto e = registry.create();
        emplacePlayer(registry, e, at, ShipConfig{});
        return e;
    }

    entt::entity spawnAmmo(const Vector& at, float heading, float speed, float turnRate) {
        auto e = registry.create();
        registry.emplace<Components::AmmoPickup>(e);
        registry.emplace<Components::Position>(e, at);
        registry.emplace<Components::Angle>(e, heading, turnRate);
        registry.emplace<Components::Velocity>(e, speed);
        registry.emplace<Components::CenterRotation>(e, 0.0f, 2.0f);
        auto& geometry = registry.emplace<Components::Geometry>(e);
        geometry.width = 8.0f;
        geometry.height = 8.0f;
        return e;
    }

    void runPickups() {
        pickupSystem.update(registry, ctx);
        ctx.commands.apply(registry);
    }
};

TEST_F(PickupTest, BoundedTurnNeverOvershoots) {
    // Target straight along +y from a heading of 0 is a quarter turn away
    EXPECT_NEAR(boundedTurn(0.0f, Vector(0.0f, 1.0f), 0.5f), 0.5f, 1e-6f);
    EXPECT_NEAR(boundedTurn(0.0f, Vector(0.0f, -1.0f), 0.5f), -0.5f, 1e-6f);
    EXPECT_NEAR(boundedTurn(0.0f, Vector(1.0f, 0.1f), 0.5f), std::atan2(0.1f, 1.0f), 1e-5f);
}

TEST_F(PickupTest, SpawnsAtSideEdgesOnTimers) {
    ctx.spawnTimers.ammoPickup.tick(1.0f);
    ctx.spawnTimers.boostPickup.tick(2.0f);
    spawnSystem.update(registry, ctx);
    ctx.commands.apply(registry);

    ASSERT_EQ(registry.view<Components::AmmoPickup>().size(), 1u);
    ASSERT_EQ(registry.view<Components::BoostPickup>().size(), 1u);

    for (auto [entity, pos, angle] : registry.view<Components::Position, Components::Angle>().each()) {
        bool const onLeft = pos.x == 0.0f;
        bool const onRight = pos.x == ctx.config.ScreenWidth;
        EXPECT_TRUE(onLeft || onRight);
        // Heading points into the screen
        EXPECT_FLOAT_EQ(angle.radians, onLeft ? 0.0f : GameConstants::Pi);
        EXPECT_GE(pos.y, 0.0f);
        EXPECT_LE(pos.y, ctx.config.ScreenHeight);
    }
}

TEST_F(PickupTest, AmmoSteersTowardPlayer) {
    spawnPlayer(Vector(200.0f, 200.0f));
    float const turnRate = 1.0f;
    auto ammo = spawnAmmo(Vector(100.0f, 100.0f), 0.0f, 10.0f, turnRate);

    runPickups();

    // Target is 45 degrees to the right; one step turns at most rate * dt
    const auto& angle = registry.get<Components::Angle>(ammo);
    EXPECT_NEAR(angle.radians, turnRate * 0.0625f, 1e-5f);

    const auto& spin = registry.get<Components::CenterRotation>(ammo);
    EXPECT_NEAR(spin.radians, 2.0f * 0.0625f, 1e-6f);
}

TEST_F(PickupTest, SteeringSettlesOnTarget) {
    spawnPlayer(Vector(200.0f, 200.0f));
    auto ammo = spawnAmmo(Vector(100.0f, 100.0f), 0.0f, 0.0f, 100.0f);

    runPickups();

    float const expected = std::atan2(100.0f, 100.0f);
    EXPECT_NEAR(registry.get<Components::Angle>(ammo).radians, expected, 1e-4f);
}

TEST_F(PickupTest, EntersCaptureInsideTriggerRadius) {
    spawnPlayer(Vector(200.0f, 200.0f));
    auto ammo = spawnAmmo(Vector(190.0f, 200.0f), 0.0f, 0.0f, 1.0f);

    runPickups();
    ASSERT_TRUE(registry.all_of<Components::Capturing>(ammo));
    EXPECT_EQ(registry.get<Components::Capturing>(ammo).kind, Components::PickupKind::Ammo);

    // Capturing pickups no longer move
    Vector const before = registry.get<Components::Position>(ammo);
    registry.get<Components::Velocity>(ammo).current = 50.0f;
    runPickups();
    EXPECT_FLOAT_EQ(registry.get<Components::Position>(ammo).x, before.x);
}

TEST_F(PickupTest, LeavesScreenAndDespawns) {
    auto ammo = spawnAmmo(Vector(-1.0f, 100.0f), GameConstants::Pi, 32.0f, 0.0f);
    runPickups();  // x = -3, box still touches the edge
    EXPECT_TRUE(registry.valid(ammo));
    runPickups();  // x = -5, fully outside
    EXPECT_FALSE(registry.valid(ammo));
}

TEST_F(PickupTest, CaptureRewardsAndExplodes) {
    auto player = spawnPlayer(Vector(200.0f, 200.0f));
    registry.get<Components::Player>(player).ammo = 50;
    registry.get<Components::Boost>(player).current = 10.0f;

    auto ammo = spawnAmmo(Vector(200.0f, 200.0f), 0.0f, 0.0f, 0.0f);
    auto boostPickup = registry.create();
    registry.emplace<Components::Position>(boostPickup, 200.0f, 200.0f);
    registry.emplace<Components::Geometry>(boostPickup);

    Components::Capturing ammoCapture{Timer(0.125f, false), Components::PickupKind::Ammo};
    Components::Capturing boostCapture{Timer(0.125f, false), Components::PickupKind::Boost};
    registry.emplace<Components::Capturing>(ammo, ammoCapture);
    registry.emplace<Components::Capturing>(boostPickup, boostCapture);

    captureSystem.update(registry, ctx);
    ctx.commands.apply(registry);
    EXPECT_TRUE(registry.valid(ammo));
    EXPECT_GT(registry.get<Components::Geometry>(ammo).scaleX, 1.0f);

    captureSystem.update(registry, ctx);
    ctx.commands.apply(registry);
    EXPECT_FALSE(registry.valid(ammo));
    EXPECT_FALSE(registry.valid(boostPickup));

    PickupCaptureConfig const defaults;
    EXPECT_EQ(registry.get<Components::Player>(player).ammo, 50 + defaults.ammoPerPickup);
    EXPECT_FLOAT_EQ(registry.get<Components::Boost>(player).current, 10.0f + defaults.boostRefill);
    EXPECT_EQ(registry.view<Components::LineParticle>().size(),
              static_cast<std::size_t>(2 * defaults.burst.count));
}

TEST_F(PickupTest, AmmoClampedToMax) {
    auto player = spawnPlayer(Vector(200.0f, 200.0f));
    auto& stats = registry.get<Components::Player>(player);
    stats.ammo = stats.maxAmmo - 1;

    auto ammo = spawnAmmo(Vector(200.0f, 200.0f), 0.0f, 0.0f, 0.0f);
    registry.emplace<Components::Capturing>(
        ammo, Components::Capturing{Timer(0.0625f, false), Components::PickupKind::Ammo});

    captureSystem.update(registry, ctx);
    ctx.commands.apply(registry);
    EXPECT_EQ(registry.get<Components::Player>(player).ammo, registry.get<Components::Player>(player).maxAmmo);
}
