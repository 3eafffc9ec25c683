#include "bytepath/systems/pickup_spawn.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

namespace {

struct EdgeSpawn {
    Vector position;
    float heading;
};

EdgeSpawn pickEdge(Resources::Random& random, const GameConfig& config, float margin) {
    bool const fromLeft = random.chance(0.5f);
    float const y = random.uniform(margin, config.ScreenHeight - margin);
    if (fromLeft) {
        return {Vector(0.0f, y), 0.0f};
    }
    return {Vector(config.ScreenWidth, y), GameConstants::Pi};
}

} // namespace

void PickupSpawnSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("PickupSpawnSystem");
    (void)registry;

    PickupSpawnConfig const cfg = specificConfig;

    if (ctx.spawnTimers.ammoPickup.finished()) {
        EdgeSpawn const edge = pickEdge(ctx.random, gameConfig, cfg.edgeMargin);
        float const speed = ctx.random.uniform(cfg.ammoMinSpeed, cfg.ammoMaxSpeed);
        float const spin = ctx.random.uniform(cfg.minSpin, cfg.maxSpin);

        ctx.commands.spawn([edge, speed, spin, cfg](entt::registry& reg, entt::entity entity) {
            reg.emplace<Components::AmmoPickup>(entity);
            reg.emplace<Components::Position>(entity, edge.position);
            reg.emplace<Components::Angle>(entity, edge.heading, cfg.ammoTurnRate);
            reg.emplace<Components::Velocity>(entity, speed);
            reg.emplace<Components::CenterRotation>(entity, 0.0f, spin);

            auto& geometry = reg.emplace<Components::Geometry>(entity);
            geometry.shape = Components::ShapeType::BoxOutline;
            geometry.width = cfg.ammoSize;
            geometry.height = cfg.ammoSize;
            geometry.zIndex = GameConstants::ZIndex::Pickup;
            geometry.color = GameConstants::Colors::Ammunition;
        });
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "PickupSpawnSystem: ammo at y=" << edge.position.y << "\n");
    }

    if (ctx.spawnTimers.boostPickup.finished()) {
        EdgeSpawn const edge = pickEdge(ctx.random, gameConfig, cfg.edgeMargin);
        float const spin = ctx.random.uniform(cfg.minSpin, cfg.maxSpin);

        ctx.commands.spawn([edge, spin, cfg](entt::registry& reg, entt::entity entity) {
            reg.emplace<Components::BoostPickup>(entity);
            reg.emplace<Components::Position>(entity, edge.position);
            reg.emplace<Components::Angle>(entity, edge.heading, 0.0f);
            reg.emplace<Components::Velocity>(entity, cfg.boostSpeed);
            reg.emplace<Components::CenterRotation>(entity, 0.0f, spin);

            auto& geometry = reg.emplace<Components::Geometry>(entity);
            geometry.shape = Components::ShapeType::Diamond;
            geometry.width = cfg.boostSize;
            geometry.height = cfg.boostSize;
            geometry.zIndex = GameConstants::ZIndex::Pickup;
            geometry.color = GameConstants::Colors::Boost;
        });
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "PickupSpawnSystem: boost at y=" << edge.position.y << "\n");
    }
}

SystemAccess PickupSpawnSystem::access() const {
    return SystemAccess{}
        .read<Resources::SpawnTimers>()
        .write<Resources::Random>();
}

} // namespace Systems
