/**
 * @file player_spawn.hpp
 * @brief Creates the player ship at startup
 */

#pragma once

#include "bytepath/math/vector_math.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Attaches the full player component set to an existing entity
 */
void emplacePlayer(entt::registry& registry, entt::entity entity,
                   const Vector& position, const ShipConfig& config);

/**
 * @class PlayerSpawnSystem
 * @brief Startup system: queues the ship at screen centre and announces it
 *
 * The ship is built from GameConfig::Ship.
 */
class PlayerSpawnSystem : public ISystem {
public:
    std::string name() const override { return "player_spawn_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
