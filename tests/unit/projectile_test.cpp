#include <gtest/gtest.h>
#include <initializer_list>
#include "bytepath/systems/projectile.hpp"
#include "bytepath/systems/projectile_death.hpp"
#include "bytepath/systems/projectile_spawn.hpp"
#include "bytepath/systems/player_spawn.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"

using namespace Systems;

class ProjectileTest : public ::testing::Test {
protected:
    entt::registry registry;
    GameContext ctx;
    ProjectileSpawnSystem spawnSystem;
    ProjectileSystem flightSystem;
    ProjectileDeathSystem deathSystem;
    ReaderId reader;

    void SetUp() override {
        for (ISystem* system : std::initializer_list<ISystem*>{&spawnSystem, &flightSystem, &deathSystem}) {
            system->setGameConfig(ctx.config);
            system->setup(registry, ctx);
        }
        reader = ctx.events.registerReader();
    }

    entt::entity spawnProjectile(const Vector& at, float heading, float speed) {
        auto e = registry.create();
        registry.emplace<Components::Projectile>(e);
        registry.emplace<Components::Position>(e, at);
        registry.emplace<Components::Angle>(e, heading, 0.0f);
        registry.emplace<Components::Velocity>(e, speed);
        return e;
    }

    void setDelta(float dt) {
        ctx.time.raw = dt;
        ctx.time.scaled = dt;
    }

    std::size_t projectileCount() { return registry.view<Components::Projectile>().size(); }
};

TEST_F(ProjectileTest, FiresOnlyWhenTimerFinishes) {
    auto player = registry.create();
    emplacePlayer(registry, player, Vector(240.0f, 135.0f), ShipConfig{});

    ctx.spawnTimers.projectile.tick(0.125f);
    spawnSystem.update(registry, ctx);
    ctx.commands.apply(registry);
    EXPECT_EQ(projectileCount(), 0u);

    ctx.spawnTimers.projectile.tick(0.125f);
    spawnSystem.update(registry, ctx);
    ctx.commands.apply(registry);
    ASSERT_EQ(projectileCount(), 1u);
    EXPECT_EQ(registry.view<Components::ShootingEffect>().size(), 1u);

    // Starts ahead of the ship along its heading (facing up)
    auto projectile = *registry.view<Components::Projectile>().begin();
    const auto& pos = registry.get<Components::Position>(projectile);
    EXPECT_NEAR(pos.x, 240.0f, 1e-3f);
    EXPECT_NEAR(pos.y, 135.0f - ProjectileConfig{}.muzzleOffset, 1e-3f);
}

TEST_F(ProjectileTest, AltFireSpawnsFanAndCostsAmmo) {
    auto player = registry.create();
    emplacePlayer(registry, player, Vector(240.0f, 135.0f), ShipConfig{});
    int const ammoBefore = registry.get<Components::Player>(player).ammo;

    ctx.keys = {ctx.config.Keys.altFire};
    ctx.spawnTimers.projectile.tick(0.25f);
    spawnSystem.update(registry, ctx);
    ctx.commands.apply(registry);

    EXPECT_EQ(projectileCount(), 3u);
    EXPECT_EQ(registry.get<Components::Player>(player).ammo, ammoBefore - ProjectileConfig{}.fanAmmoCost);
}

TEST_F(ProjectileTest, NoPlayerNoShots) {
    ctx.spawnTimers.projectile.tick(0.25f);
    spawnSystem.update(registry, ctx);
    ctx.commands.apply(registry);
    EXPECT_EQ(projectileCount(), 0u);
}

TEST_F(ProjectileTest, FliesAlongOwnHeading) {
    auto e = spawnProjectile(Vector(100.0f, 100.0f), 0.0f, 200.0f);
    setDelta(0.125f);
    flightSystem.update(registry, ctx);
    ctx.commands.apply(registry);

    const auto& pos = registry.get<Components::Position>(e);
    EXPECT_FLOAT_EQ(pos.x, 125.0f);
    EXPECT_FLOAT_EQ(pos.y, 100.0f);
}

TEST_F(ProjectileTest, CrossingEdgeLeavesClampedDeadProjectile) {
    spawnProjectile(Vector(475.0f, 100.0f), 0.0f, 200.0f);
    setDelta(0.125f);
    flightSystem.update(registry, ctx);
    ctx.commands.apply(registry);

    EXPECT_EQ(projectileCount(), 0u);

    auto dead = registry.view<Components::DeadProjectile, Components::Position>();
    ASSERT_EQ(dead.size_hint(), 1u);
    const auto& pos = dead.get<Components::Position>(*dead.begin());
    EXPECT_FLOAT_EQ(pos.x, ctx.config.ScreenWidth);
    EXPECT_FLOAT_EQ(pos.y, 100.0f);

    auto events = ctx.events.read(reader);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, GameEventType::ProjectileDeath);
    EXPECT_FLOAT_EQ(events[0].position.x, ctx.config.ScreenWidth);
}

TEST_F(ProjectileTest, EveryEdgeCounts) {
    spawnProjectile(Vector(2.0f, 100.0f), GameConstants::Pi, 200.0f);
    spawnProjectile(Vector(100.0f, 2.0f), -GameConstants::Pi / 2.0f, 200.0f);
    spawnProjectile(Vector(100.0f, 268.0f), GameConstants::Pi / 2.0f, 200.0f);
    setDelta(0.125f);
    flightSystem.update(registry, ctx);
    ctx.commands.apply(registry);

    EXPECT_EQ(projectileCount(), 0u);
    EXPECT_EQ(registry.view<Components::DeadProjectile>().size(), 3u);
    for (auto [entity, dead, pos] : registry.view<Components::DeadProjectile, Components::Position>().each()) {
        EXPECT_GE(pos.x, 0.0f);
        EXPECT_LE(pos.x, ctx.config.ScreenWidth);
        EXPECT_GE(pos.y, 0.0f);
        EXPECT_LE(pos.y, ctx.config.ScreenHeight);
    }
}

TEST_F(ProjectileTest, DeadProjectileAnimatesThenDespawns) {
    spawnProjectile(Vector(479.0f, 100.0f), 0.0f, 200.0f);
    setDelta(0.0625f);
    flightSystem.update(registry, ctx);
    ctx.commands.apply(registry);

    auto deadEntity = *registry.view<Components::DeadProjectile>().begin();
    auto& geometry = registry.get<Components::Geometry>(deadEntity);

    deathSystem.update(registry, ctx);  // 0.0625
    ctx.commands.apply(registry);
    EXPECT_EQ(geometry.frame, 0);

    deathSystem.update(registry, ctx);  // 0.125
    ctx.commands.apply(registry);
    EXPECT_EQ(geometry.frame, 1);

    deathSystem.update(registry, ctx);  // 0.1875
    ctx.commands.apply(registry);
    ASSERT_TRUE(registry.valid(deadEntity));

    deathSystem.update(registry, ctx);  // 0.25
    ctx.commands.apply(registry);
    EXPECT_FALSE(registry.valid(deadEntity));
}
