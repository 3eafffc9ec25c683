/**
 * @file projectile_death.hpp
 * @brief Two-frame wall impact animation
 *
 * Shows frame 0 in the default colour until frameSwitchSeconds, then frame 1
 * in the death colour, and despawns the entity when its timer finishes.
 */

#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

class ProjectileDeathSystem : public ISystem {
public:
    std::string name() const override { return "projectile_death_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
