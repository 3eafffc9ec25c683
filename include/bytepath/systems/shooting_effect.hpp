/**
 * @file shooting_effect.hpp
 * @brief Muzzle flash square that sticks to the ship's nose
 *
 * Required components:
 * - ShootingEffect, FollowPlayer, Position (to modify), Geometry (to modify),
 *   Interpolation (scale 1 -> 0)
 *
 * The effect despawns when its interpolation finishes or the ship is gone.
 */

#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

class ShootingEffectSystem : public ISystem {
public:
    std::string name() const override { return "shooting_effect_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
