#include "bytepath/systems/tick_effect.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/interpolation.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/player.hpp"

namespace Systems {

void TickEffectSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("TickEffectSystem");

    auto player = findPlayer(registry);
    auto view = registry.view<Components::TickEffect, Components::Position,
                              Components::Geometry, Components::Interpolation>();

    if (!player) {
        for (auto entity : view) {
            ctx.commands.despawn(entity);
        }
        return;
    }

    const auto& playerPos = registry.get<Components::Position>(*player);

    for (auto [entity, pos, geometry, interpolation] : view.each()) {
        pos = playerPos;
        auto result = interpolation.eval(ctx.time.scaled);
        geometry.scaleY = result.values[0];
        if (result.finished) {
            ctx.commands.despawn(entity);
        }
    }

    if (ctx.spawnTimers.tickEffect.finished()) {
        TickEffectConfig const cfg = specificConfig;
        Vector const at = playerPos;
        ctx.commands.spawn([at, cfg](entt::registry& reg, entt::entity entity) {
            reg.emplace<Components::TickEffect>(entity);
            reg.emplace<Components::Position>(entity, at);
            reg.emplace<Components::Interpolation>(
                entity, cfg.seconds,
                std::vector<std::pair<float, float>>{{1.0f, 0.0f}},
                Easing::Curve::EaseInSine);

            auto& geometry = reg.emplace<Components::Geometry>(entity);
            geometry.shape = Components::ShapeType::Box;
            geometry.width = cfg.width;
            geometry.height = cfg.height;
            geometry.zIndex = GameConstants::ZIndex::TickEffect;
            geometry.color = GameConstants::Colors::Default;
        });
    }
}

SystemAccess TickEffectSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Resources::SpawnTimers, Components::Player>()
        .write<Components::Position, Components::Geometry, Components::Interpolation>();
}

} // namespace Systems
