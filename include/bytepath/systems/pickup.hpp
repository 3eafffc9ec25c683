/**
 * @file pickup.hpp
 * @brief Pickup flight, homing and capture detection
 *
 * This system handles, for every AmmoPickup and BoostPickup not yet
 * Capturing:
 * - Spinning about the centre (CenterRotation)
 * - Steering ammo toward the ship, at most Angle::rotationSpeed * dt per
 *   step and never past the target direction
 * - Moving along the heading
 * - Starting the capture once inside the trigger radius of the ship
 * - Despawning pickups whose bounding box has fully left the screen
 */

#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct PickupConfig {
    float triggerRadius = 20.0f;
    float captureSeconds = 0.2f;
};

/**
 * @brief Heading change toward a target, limited to +/- maxTurn
 *
 * The returned turn never overshoots: if the target is within maxTurn the
 * full signed angle is returned.
 */
float boundedTurn(float heading, const Vector& toTarget, float maxTurn);

class PickupSystem : public ConfigurableSystem<PickupConfig> {
public:
    std::string name() const override { return "pickup_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
