/**
 * @file player_respawn.hpp
 * @brief Replaces a dead player after a delay
 *
 * While no player exists a one-shot timer runs on scaled time. When it
 * finishes a new ship is queued at screen centre and PlayerSpawn is sent.
 * The timer restarts from zero every time a player is present. The new ship
 * uses GameConfig::Ship, like the startup spawn.
 */

#pragma once

#include "bytepath/core/timer.hpp"
#include "bytepath/systems/player_spawn.hpp"

namespace Systems {

class PlayerRespawnSystem : public ISystem {
public:
    std::string name() const override { return "player_respawn_system"; }
    void setup(entt::registry& registry, GameContext& ctx) override;
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;

    const Timer& getRespawnTimer() const { return respawnTimer; }

private:
    Timer respawnTimer;
};

} // namespace Systems
