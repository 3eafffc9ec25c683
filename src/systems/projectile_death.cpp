#include "bytepath/systems/projectile_death.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

void ProjectileDeathSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("ProjectileDeathSystem");

    auto view = registry.view<Components::DeadProjectile, Components::Geometry>();
    for (auto [entity, dead, geometry] : view.each()) {
        dead.timer.tick(ctx.time.scaled);

        if (dead.timer.elapsed() >= dead.frameSwitchSeconds) {
            geometry.frame = 1;
            geometry.color = GameConstants::Colors::Death;
        }

        if (dead.timer.finished()) {
            ctx.commands.despawn(entity);
        }
    }
}

SystemAccess ProjectileDeathSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime>()
        .write<Components::DeadProjectile, Components::Geometry>();
}

} // namespace Systems
