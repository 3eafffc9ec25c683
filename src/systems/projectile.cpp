#include "bytepath/systems/projectile.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/bounds.hpp"

namespace Systems {

void ProjectileSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("ProjectileSystem");

    float const dt = ctx.time.scaled;
    ProjectileDeathConfig const cfg = specificConfig;

    auto view = registry.view<Components::Projectile, Components::Position,
                              Components::Angle, Components::Velocity>();
    for (auto [entity, pos, angle, vel] : view.each()) {
        pos += Vector::fromAngle(angle.radians) * (vel.current * dt);

        // Projectiles are points: out as soon as the centre crosses an edge
        if (!isOutsideScreen(pos, 0.0f, 0.0f, gameConfig)) {
            continue;
        }

        Vector const impact = clampToScreen(pos, gameConfig);
        float const heading = angle.radians;

        ctx.commands.despawn(entity);
        ctx.commands.spawn([impact, heading, cfg](entt::registry& reg, entt::entity dead) {
            reg.emplace<Components::Position>(dead, impact);

            auto& deadProjectile = reg.emplace<Components::DeadProjectile>(dead);
            deadProjectile.timer = Timer(cfg.seconds, false);
            deadProjectile.frameSwitchSeconds = cfg.frameSwitchSeconds;

            auto& geometry = reg.emplace<Components::Geometry>(dead);
            geometry.shape = Components::ShapeType::Box;
            geometry.width = cfg.size;
            geometry.height = cfg.size;
            geometry.rotation = heading;
            geometry.zIndex = GameConstants::ZIndex::DeadProjectile;
            geometry.color = GameConstants::Colors::Default;
            geometry.frame = 0;
        });
        ctx.events.send(GameEvent{GameEventType::ProjectileDeath, impact});
    }
}

SystemAccess ProjectileSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Projectile,
              Components::Angle, Components::Velocity>()
        .write<Components::Position, EventChannel<GameEvent>>();
}

} // namespace Systems
