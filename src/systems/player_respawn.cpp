#include "bytepath/systems/player_respawn.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/player.hpp"

#include <iostream>

namespace Systems {

void PlayerRespawnSystem::setup(entt::registry& registry, GameContext& ctx) {
    (void)registry;
    (void)ctx;
    respawnTimer = Timer(gameConfig.PlayerRespawnSeconds, false);
}

void PlayerRespawnSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("PlayerRespawnSystem");

    if (findPlayer(registry)) {
        respawnTimer.reset();
        return;
    }

    respawnTimer.tick(ctx.time.scaled);
    if (!respawnTimer.finished()) {
        return;
    }
    respawnTimer.reset();

    Vector const center(gameConfig.ScreenWidth / 2.0f, gameConfig.ScreenHeight / 2.0f);
    ShipConfig const cfg = gameConfig.Ship;
    ctx.commands.spawn([center, cfg](entt::registry& reg, entt::entity entity) {
        emplacePlayer(reg, entity, center, cfg);
    });
    ctx.events.send(GameEvent{GameEventType::PlayerSpawn, center});

    std::cout << "PlayerRespawnSystem: player respawned (#"
              << respawnTimer.count() << ")" << std::endl;
}

SystemAccess PlayerRespawnSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Player>()
        .write<EventChannel<GameEvent>>();
}

} // namespace Systems
