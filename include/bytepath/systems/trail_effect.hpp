/**
 * @file trail_effect.hpp
 * @brief Exhaust trail behind the ship
 *
 * While a ship exists, a small circle is dropped at its tail every
 * `spawnSeconds` of scaled time, coloured by whether the ship is boosting.
 * Trail circles shrink to nothing and despawn. When the ship is gone no
 * trails spawn and the remaining ones are despawned.
 */

#pragma once

#include "bytepath/core/timer.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct TrailConfig {
    float spawnSeconds = 0.01f;
    float tailOffset = 10.0f;     // distance behind the ship centre
    float minSize = 4.0f;
    float maxSize = 7.0f;
    float minSeconds = 0.15f;
    float maxSeconds = 0.25f;
};

class TrailEffectSystem : public ConfigurableSystem<TrailConfig> {
public:
    std::string name() const override { return "trail_effect_system"; }
    void setup(entt::registry& registry, GameContext& ctx) override;
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;

private:
    Timer spawnTimer;
};

} // namespace Systems
