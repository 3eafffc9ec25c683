/**
 * @file game_context.hpp
 * @brief Everything a system may touch besides the registry
 */

#pragma once

#include "bytepath/core/command_buffer.hpp"
#include "bytepath/core/events.hpp"
#include "bytepath/core/game_config.hpp"
#include "bytepath/core/resources.hpp"
#include "bytepath/core/shake.hpp"
#include "bytepath/core/time_dilation.hpp"

/**
 * @struct GameContext
 * @brief Resources owned by the game and threaded into every system update
 *
 * Systems borrow the members they declared in ISystem::access() for the
 * duration of their update only.
 */
struct GameContext {
    GameConfig config;

    Resources::FrameTime time;
    Resources::TimeDilation dilation;
    Resources::SpawnTimers spawnTimers;
    Resources::Keycodes keys;
    Resources::ShakeGenerator shake;
    Resources::Camera camera;
    Resources::Flash flash;
    Resources::Random random;

    EventChannel<GameEvent> events;
    CommandBuffer commands;

    GameContext() : GameContext(GameConfig{}) {}

    explicit GameContext(const GameConfig& cfg)
        : config(cfg)
        , dilation(cfg.SlowDownDurationSeconds, cfg.SlowDownMinimumSpeed)
        , shake(cfg.Shake)
    {
        spawnTimers.projectile = Timer(cfg.ProjectileSpawnSeconds, true);
        spawnTimers.tickEffect = Timer(cfg.TickEffectSpawnSeconds, true);
        spawnTimers.ammoPickup = Timer(cfg.AmmoPickupSpawnSeconds, true);
        spawnTimers.boostPickup = Timer(cfg.BoostPickupSpawnSeconds, true);
        random.engine.seed(cfg.RandomSeed);
    }

    bool isPressed(sf::Keyboard::Key key) const { return keys.count(key) > 0; }
};
