/**
 * @file tick_effect.hpp
 * @brief Periodic pulse around the ship
 *
 * Each time SpawnTimers::tickEffect finishes a box is spawned over the ship.
 * It stays centred on the ship while its height collapses to zero, then
 * despawns. No ship, no pulse.
 */

#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct TickEffectConfig {
    float width = 48.0f;
    float height = 32.0f;
    float seconds = 0.2f;
};

class TickEffectSystem : public ConfigurableSystem<TickEffectConfig> {
public:
    std::string name() const override { return "tick_effect_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
