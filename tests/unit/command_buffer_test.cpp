#include <gtest/gtest.h>
#include "bytepath/core/command_buffer.hpp"
#include "bytepath/components/basic.hpp"

class CommandBufferTest : public ::testing::Test {
protected:
    entt::registry registry;
    CommandBuffer commands;
};

TEST_F(CommandBufferTest, SpawnIsDeferredUntilApply) {
    commands.spawn([](entt::registry& reg, entt::entity entity) {
        reg.emplace<Components::Position>(entity, 1.0f, 2.0f);
    });
    EXPECT_EQ(commands.pendingSpawns(), 1u);
    EXPECT_TRUE(registry.view<Components::Position>().empty());

    EXPECT_EQ(commands.apply(registry), 1u);
    EXPECT_TRUE(commands.empty());

    auto view = registry.view<Components::Position>();
    ASSERT_EQ(view.size(), 1u);
    EXPECT_FLOAT_EQ(view.get<Components::Position>(*view.begin()).x, 1.0f);
}

TEST_F(CommandBufferTest, DespawnDuringIterationIsSafe) {
    for (int i = 0; i < 5; ++i) {
        auto e = registry.create();
        registry.emplace<Components::Projectile>(e);
    }

    for (auto entity : registry.view<Components::Projectile>()) {
        commands.despawn(entity);
    }
    EXPECT_EQ(registry.view<Components::Projectile>().size(), 5u);

    commands.apply(registry);
    EXPECT_EQ(registry.view<Components::Projectile>().size(), 0u);
}

TEST_F(CommandBufferTest, DoubleDespawnIsNoOp) {
    auto e = registry.create();
    commands.despawn(e);
    commands.despawn(e);
    commands.apply(registry);
    EXPECT_FALSE(registry.valid(e));
}

TEST_F(CommandBufferTest, InsertAttachesToLiveEntitiesOnly) {
    auto alive = registry.create();
    auto gone = registry.create();

    commands.despawn(gone);
    commands.insert<Components::FollowPlayer>(alive, Components::FollowPlayer{3.0f});
    commands.insert<Components::FollowPlayer>(gone, Components::FollowPlayer{4.0f});
    commands.apply(registry);

    ASSERT_TRUE(registry.all_of<Components::FollowPlayer>(alive));
    EXPECT_FLOAT_EQ(registry.get<Components::FollowPlayer>(alive).distance, 3.0f);
    EXPECT_FALSE(registry.valid(gone));
}

TEST_F(CommandBufferTest, AppliesInRecordingOrder) {
    auto e = registry.create();
    commands.insert<Components::Velocity>(e, Components::Velocity(1.0f));
    commands.edit([e](entt::registry& reg) {
        reg.get<Components::Velocity>(e).current = 7.0f;
    });
    commands.apply(registry);
    EXPECT_FLOAT_EQ(registry.get<Components::Velocity>(e).current, 7.0f);
}
