/**
 * @file projectile_spawn.hpp
 * @brief Fires projectiles from the ship on the projectile spawn timer
 *
 * Every time SpawnTimers::projectile finishes, the ship fires one projectile
 * along its heading, or a three-way fan while the alt-fire key is held and
 * enough ammo is left. Projectiles start `muzzleOffset` pixels ahead of the
 * ship's centre. Each shot also leaves a shooting effect at the nose.
 */

#pragma once

#include "bytepath/core/constants.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct ProjectileConfig {
    float speed = 200.0f;                 // pixels per second
    float size = 5.0f;                    // diameter in pixels
    float muzzleOffset = 12.0f;           // distance ahead of the ship centre
    float fanSpread = GameConstants::Pi / 12.0f;
    int fanAmmoCost = 2;

    float effectSize = 8.0f;
    float effectSeconds = 0.1f;
};

class ProjectileSpawnSystem : public ConfigurableSystem<ProjectileConfig> {
public:
    std::string name() const override { return "projectile_spawn_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
