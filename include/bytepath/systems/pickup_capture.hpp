/**
 * @file pickup_capture.hpp
 * @brief Capture pulse and reward of a collected pickup
 *
 * A Capturing pickup grows while its timer runs. When the timer finishes
 * the pickup despawns, the ship is rewarded (ammo or boost refill, clamped
 * to the maximum) and a small explosion is spawned in the pickup's colour.
 * A capture that finishes after the ship died still despawns and explodes.
 */

#pragma once

#include "bytepath/systems/explosion.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct PickupCaptureConfig {
    float growth = 1.0f;          // extra scale reached at the end of the pulse
    int ammoPerPickup = 5;
    float boostRefill = 25.0f;
    ExplosionConfig burst;
};

class PickupCaptureSystem : public ConfigurableSystem<PickupCaptureConfig> {
public:
    std::string name() const override { return "pickup_capture_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
