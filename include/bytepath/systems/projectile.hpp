/**
 * @file projectile.hpp
 * @brief Projectile flight and wall impacts
 *
 * Projectiles move along their own heading at Velocity::current. A
 * projectile whose centre has left the screen is despawned; in its place a
 * DeadProjectile is spawned at the position clamped into the screen and a
 * ProjectileDeath event carries that clamped position.
 */

#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct ProjectileDeathConfig {
    float seconds = 0.25f;           // total life of the impact animation
    float frameSwitchSeconds = 0.1f; // frame 0 -> frame 1
    float size = 6.0f;
};

class ProjectileSystem : public ConfigurableSystem<ProjectileDeathConfig> {
public:
    std::string name() const override { return "projectile_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
