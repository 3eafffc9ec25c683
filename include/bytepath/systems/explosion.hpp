/**
 * @file explosion.hpp
 * @brief Radial bursts of line particles
 *
 * spawnExplosion() queues `count` line particles at a point, each with a
 * random direction, speed, length and lifetime. ExplosionSystem spawns a
 * large burst in the death colour wherever a PlayerDeath happened; pickup
 * captures use the helper directly.
 */

#pragma once

#include <SFML/Graphics/Color.hpp>
#include "bytepath/core/command_buffer.hpp"
#include "bytepath/core/events.hpp"
#include "bytepath/core/resources.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct ExplosionConfig {
    int count = 8;
    float minSpeed = 50.0f;
    float maxSpeed = 150.0f;
    float minLength = 3.0f;
    float maxLength = 8.0f;
    float minSeconds = 0.3f;
    float maxSeconds = 0.5f;
    float width = 2.0f;
};

/**
 * @brief Queues a burst of line particles centred on `at`
 */
void spawnExplosion(CommandBuffer& commands, Resources::Random& random,
                    const Vector& at, const sf::Color& color,
                    const ExplosionConfig& config);

class ExplosionSystem : public ConfigurableSystem<ExplosionConfig> {
public:
    ExplosionSystem() {
        specificConfig.count = 24;
        specificConfig.maxSpeed = 250.0f;
        specificConfig.maxLength = 12.0f;
        specificConfig.maxSeconds = 0.8f;
    }

    std::string name() const override { return "explosion_system"; }
    void setup(entt::registry& registry, GameContext& ctx) override;
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;

private:
    ReaderId deathReader;
};

} // namespace Systems
