#include "bytepath/systems/explosion.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/interpolation.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

void spawnExplosion(CommandBuffer& commands, Resources::Random& random,
                    const Vector& at, const sf::Color& color,
                    const ExplosionConfig& config)
{
    for (int i = 0; i < config.count; ++i) {
        float const direction = random.uniform(0.0f, GameConstants::TwoPi);
        Components::LineParticle particle;
        particle.speed = random.uniform(config.minSpeed, config.maxSpeed);
        particle.length = random.uniform(config.minLength, config.maxLength);
        particle.width = config.width;
        particle.color = color;
        float const seconds = random.uniform(config.minSeconds, config.maxSeconds);

        commands.spawn([at, direction, particle, seconds](entt::registry& registry, entt::entity entity) {
            registry.emplace<Components::Position>(entity, at);
            registry.emplace<Components::Angle>(entity, direction, 0.0f);
            registry.emplace<Components::LineParticle>(entity, particle);
            // speed and width both fade to zero over the particle's life
            registry.emplace<Components::Interpolation>(
                entity, seconds,
                std::vector<std::pair<float, float>>{{particle.speed, 0.0f},
                                                     {particle.width, 0.0f}},
                Easing::Curve::EaseOutCubic);
        });
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "spawnExplosion: " << config.count
              << " particles at (" << at.x << ", " << at.y << ")\n");
}

void ExplosionSystem::setup(entt::registry& registry, GameContext& ctx) {
    (void)registry;
    deathReader = ctx.events.registerReader();
}

void ExplosionSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("ExplosionSystem");
    (void)registry;

    for (const auto& event : ctx.events.read(deathReader)) {
        if (event.type == GameEventType::PlayerDeath) {
            spawnExplosion(ctx.commands, ctx.random, event.position,
                           GameConstants::Colors::Death, specificConfig);
        }
    }
}

SystemAccess ExplosionSystem::access() const {
    return SystemAccess{}
        .read<EventChannel<GameEvent>>()
        .write<Resources::Random>();
}

} // namespace Systems
