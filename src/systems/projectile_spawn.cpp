#include "bytepath/systems/projectile_spawn.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/interpolation.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/player.hpp"

#include <vector>

namespace Systems {

namespace {

void queueProjectile(CommandBuffer& commands, const Vector& origin, float heading,
                     const ProjectileConfig& cfg)
{
    Vector const start = origin + Vector::fromAngle(heading) * cfg.muzzleOffset;
    commands.spawn([start, heading, cfg](entt::registry& registry, entt::entity entity) {
        registry.emplace<Components::Projectile>(entity);
        registry.emplace<Components::Position>(entity, start);
        registry.emplace<Components::Angle>(entity, heading, 0.0f);
        registry.emplace<Components::Velocity>(entity, cfg.speed);

        auto& geometry = registry.emplace<Components::Geometry>(entity);
        geometry.shape = Components::ShapeType::Circle;
        geometry.width = cfg.size;
        geometry.height = cfg.size;
        geometry.rotation = heading;
        geometry.zIndex = GameConstants::ZIndex::Projectile;
        geometry.color = GameConstants::Colors::Default;
    });
}

void queueShootingEffect(CommandBuffer& commands, const Vector& origin, float heading,
                         const ProjectileConfig& cfg)
{
    Vector const nose = origin + Vector::fromAngle(heading) * cfg.muzzleOffset;
    commands.spawn([nose, heading, cfg](entt::registry& registry, entt::entity entity) {
        registry.emplace<Components::ShootingEffect>(entity);
        registry.emplace<Components::FollowPlayer>(entity, cfg.muzzleOffset);
        registry.emplace<Components::Position>(entity, nose);
        registry.emplace<Components::Interpolation>(
            entity, cfg.effectSeconds,
            std::vector<std::pair<float, float>>{{1.0f, 0.0f}});

        auto& geometry = registry.emplace<Components::Geometry>(entity);
        geometry.shape = Components::ShapeType::Box;
        geometry.width = cfg.effectSize;
        geometry.height = cfg.effectSize;
        geometry.rotation = heading;
        geometry.zIndex = GameConstants::ZIndex::ShootingEffect;
        geometry.color = GameConstants::Colors::Default;
    });
}

} // namespace

void ProjectileSpawnSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("ProjectileSpawnSystem");

    if (!ctx.spawnTimers.projectile.finished()) {
        return;
    }

    auto player = findPlayer(registry);
    if (!player) {
        return;
    }

    const auto& pos = registry.get<Components::Position>(*player);
    float const heading = registry.get<Components::Angle>(*player).radians;
    auto& stats = registry.get<Components::Player>(*player);

    bool const fan = ctx.isPressed(gameConfig.Keys.altFire)
                  && stats.ammo >= specificConfig.fanAmmoCost;
    if (fan) {
        stats.ammo -= specificConfig.fanAmmoCost;
        queueProjectile(ctx.commands, pos, heading - specificConfig.fanSpread, specificConfig);
        queueProjectile(ctx.commands, pos, heading, specificConfig);
        queueProjectile(ctx.commands, pos, heading + specificConfig.fanSpread, specificConfig);
    } else {
        queueProjectile(ctx.commands, pos, heading, specificConfig);
    }
    queueShootingEffect(ctx.commands, pos, heading, specificConfig);

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "ProjectileSpawnSystem: fired "
              << (fan ? 3 : 1) << " projectile(s)\n");
}

SystemAccess ProjectileSpawnSystem::access() const {
    return SystemAccess{}
        .read<Resources::SpawnTimers, Resources::Keycodes,
              Components::Position, Components::Angle>()
        .write<Components::Player>();
}

} // namespace Systems
