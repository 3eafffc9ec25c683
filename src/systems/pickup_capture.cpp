#include "bytepath/systems/pickup_capture.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/player.hpp"

#include <algorithm>

namespace Systems {

void PickupCaptureSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("PickupCaptureSystem");

    auto player = findPlayer(registry);

    auto view = registry.view<Components::Capturing, Components::Position, Components::Geometry>();
    for (auto [entity, capturing, pos, geometry] : view.each()) {
        capturing.timer.tick(ctx.time.scaled);

        float const scale = 1.0f + specificConfig.growth * capturing.timer.percent();
        geometry.scaleX = scale;
        geometry.scaleY = scale;

        if (!capturing.timer.finished()) {
            continue;
        }

        ctx.commands.despawn(entity);
        spawnExplosion(ctx.commands, ctx.random, pos, geometry.color, specificConfig.burst);

        if (!player) {
            continue;
        }

        if (capturing.kind == Components::PickupKind::Ammo) {
            auto& stats = registry.get<Components::Player>(*player);
            stats.ammo = std::min(stats.maxAmmo, stats.ammo + specificConfig.ammoPerPickup);
        } else if (auto* boost = registry.try_get<Components::Boost>(*player)) {
            boost->current = std::min(boost->max, boost->current + specificConfig.boostRefill);
        }
    }
}

SystemAccess PickupCaptureSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Position>()
        .write<Components::Capturing, Components::Geometry, Components::Player,
               Components::Boost, Resources::Random>();
}

} // namespace Systems
