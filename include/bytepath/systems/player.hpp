/**
 * @file player.hpp
 * @brief Ship steering, movement and death
 *
 * This system handles:
 * - Turning by +/- rotationSpeed * dt (left adds, right subtracts)
 * - Moving along the heading by Velocity::current * dt
 * - Killing the ship when it fully leaves the screen or the death key is held
 *
 * Required components:
 * - Player, Position (to modify), Angle (to modify), Velocity (to read)
 *
 * Optional components:
 * - Geometry (rotation follows the heading; extents drive the boundary test)
 *
 * Death queues a despawn and sends PlayerDeath with the last position.
 */

#pragma once

#include <optional>
#include "bytepath/systems/i_system.hpp"

namespace Systems {

/**
 * @brief The player entity, if exactly one exists
 *
 * Zero players is a normal transient state (between death and respawn);
 * callers skip their player-dependent work when this returns nullopt.
 */
std::optional<entt::entity> findPlayer(entt::registry& registry);

class PlayerSystem : public ISystem {
public:
    std::string name() const override { return "player_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
