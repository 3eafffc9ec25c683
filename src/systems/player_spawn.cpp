#include "bytepath/systems/player_spawn.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/profile.hpp"

#include <iostream>

namespace Systems {

void emplacePlayer(entt::registry& registry, entt::entity entity,
                   const Vector& position, const ShipConfig& config)
{
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Angle>(entity, config.startAngle, config.rotationSpeed);
    registry.emplace<Components::Velocity>(entity, config.movementSpeed);

    auto& player = registry.emplace<Components::Player>(entity);
    player.maxAmmo = config.maxAmmo;
    player.ammo = config.maxAmmo;

    auto& boost = registry.emplace<Components::Boost>(entity);
    boost.max = config.boostMax;
    boost.current = config.boostMax;
    boost.incAmount = config.boostIncAmount;
    boost.decAmount = config.boostDecAmount;
    boost.cooldownSeconds = config.boostCooldownSeconds;

    auto& geometry = registry.emplace<Components::Geometry>(entity);
    geometry.shape = Components::ShapeType::Circle;
    geometry.width = config.size;
    geometry.height = config.size;
    geometry.rotation = config.startAngle;
    geometry.zIndex = GameConstants::ZIndex::Player;
    geometry.color = GameConstants::Colors::Default;
}

void PlayerSpawnSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("PlayerSpawnSystem");
    (void)registry;

    Vector const center(gameConfig.ScreenWidth / 2.0f, gameConfig.ScreenHeight / 2.0f);
    ShipConfig const cfg = gameConfig.Ship;
    ctx.commands.spawn([center, cfg](entt::registry& reg, entt::entity entity) {
        emplacePlayer(reg, entity, center, cfg);
    });
    ctx.events.send(GameEvent{GameEventType::PlayerSpawn, center});

    std::cout << "PlayerSpawnSystem: player spawned at ("
              << center.x << ", " << center.y << ")" << std::endl;
}

SystemAccess PlayerSpawnSystem::access() const {
    return SystemAccess{}.write<EventChannel<GameEvent>>();
}

} // namespace Systems
