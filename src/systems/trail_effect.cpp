#include "bytepath/systems/trail_effect.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/interpolation.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/player.hpp"

namespace Systems {

void TrailEffectSystem::setup(entt::registry& registry, GameContext& ctx) {
    (void)registry;
    (void)ctx;
    spawnTimer = Timer(specificConfig.spawnSeconds, true);
}

void TrailEffectSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("TrailEffectSystem");

    auto player = findPlayer(registry);
    auto view = registry.view<Components::TrailEffect, Components::Geometry,
                              Components::Interpolation>();

    if (!player) {
        for (auto entity : view) {
            ctx.commands.despawn(entity);
        }
        return;
    }

    for (auto [entity, geometry, interpolation] : view.each()) {
        auto result = interpolation.eval(ctx.time.scaled);
        geometry.scaleX = result.values[0];
        geometry.scaleY = result.values[0];
        if (result.finished) {
            ctx.commands.despawn(entity);
        }
    }

    spawnTimer.tick(ctx.time.scaled);
    if (!spawnTimer.finished()) {
        return;
    }

    const auto& playerPos = registry.get<Components::Position>(*player);
    float const heading = registry.get<Components::Angle>(*player).radians;
    const auto* boost = registry.try_get<Components::Boost>(*player);
    bool const boosting = boost && boost->boosting;

    Vector const tail = playerPos - Vector::fromAngle(heading) * specificConfig.tailOffset;
    float const size = ctx.random.uniform(specificConfig.minSize, specificConfig.maxSize);
    float const seconds = ctx.random.uniform(specificConfig.minSeconds, specificConfig.maxSeconds);
    sf::Color const color = boosting ? GameConstants::Colors::Boost : GameConstants::Colors::NonBoost;

    ctx.commands.spawn([tail, size, seconds, color](entt::registry& reg, entt::entity entity) {
        reg.emplace<Components::TrailEffect>(entity);
        reg.emplace<Components::Position>(entity, tail);
        reg.emplace<Components::Interpolation>(
            entity, seconds,
            std::vector<std::pair<float, float>>{{1.0f, 0.0f}},
            Easing::Curve::Linear);

        auto& geometry = reg.emplace<Components::Geometry>(entity);
        geometry.shape = Components::ShapeType::Circle;
        geometry.width = size;
        geometry.height = size;
        geometry.zIndex = GameConstants::ZIndex::TrailEffect;
        geometry.color = color;
    });
}

SystemAccess TrailEffectSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Player, Components::Position,
              Components::Angle, Components::Boost>()
        .write<Components::Geometry, Components::Interpolation, Resources::Random>();
}

} // namespace Systems
