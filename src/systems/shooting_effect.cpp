#include "bytepath/systems/shooting_effect.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/interpolation.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/player.hpp"

namespace Systems {

void ShootingEffectSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("ShootingEffectSystem");

    auto player = findPlayer(registry);
    auto view = registry.view<Components::ShootingEffect, Components::FollowPlayer,
                              Components::Position, Components::Geometry,
                              Components::Interpolation>();

    if (!player) {
        for (auto entity : view) {
            ctx.commands.despawn(entity);
        }
        return;
    }

    const auto& playerPos = registry.get<Components::Position>(*player);
    float const heading = registry.get<Components::Angle>(*player).radians;

    for (auto [entity, follow, pos, geometry, interpolation] : view.each()) {
        pos = playerPos + Vector::fromAngle(heading) * follow.distance;
        geometry.rotation = heading;

        auto result = interpolation.eval(ctx.time.scaled);
        geometry.scaleX = result.values[0];
        geometry.scaleY = result.values[0];

        if (result.finished) {
            ctx.commands.despawn(entity);
        }
    }
}

SystemAccess ShootingEffectSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Player, Components::Angle,
              Components::FollowPlayer>()
        .write<Components::Position, Components::Geometry, Components::Interpolation>();
}

} // namespace Systems
