/**
 * @file pickup_spawn.hpp
 * @brief Spawns ammo and boost pickups at the side edges
 *
 * On SpawnTimers::ammoPickup / boostPickup a pickup appears on the left or
 * right edge at a random height and heads across the screen. Ammo pickups
 * carry a turn rate so the pickup system can steer them toward the ship.
 */

#pragma once

#include "bytepath/core/constants.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct PickupSpawnConfig {
    float edgeMargin = 48.0f;      // keeps spawns away from top and bottom

    float ammoSize = 8.0f;
    float ammoMinSpeed = 10.0f;
    float ammoMaxSpeed = 20.0f;
    float ammoTurnRate = GameConstants::Pi;   // radians per second while seeking

    float boostSize = 12.0f;
    float boostSpeed = 30.0f;

    float minSpin = -6.0f;
    float maxSpin = 6.0f;
};

class PickupSpawnSystem : public ConfigurableSystem<PickupSpawnConfig> {
public:
    std::string name() const override { return "pickup_spawn_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
