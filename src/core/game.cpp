/**
 * @fileoverview game.cpp
 * @brief Implementation of Game.
 */

#include "bytepath/core/game.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "bytepath/core/debug.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/boost.hpp"
#include "bytepath/systems/camera_shake.hpp"
#include "bytepath/systems/event_update.hpp"
#include "bytepath/systems/explosion.hpp"
#include "bytepath/systems/flash.hpp"
#include "bytepath/systems/line_particle.hpp"
#include "bytepath/systems/pickup.hpp"
#include "bytepath/systems/pickup_capture.hpp"
#include "bytepath/systems/pickup_spawn.hpp"
#include "bytepath/systems/player.hpp"
#include "bytepath/systems/player_respawn.hpp"
#include "bytepath/systems/player_spawn.hpp"
#include "bytepath/systems/projectile.hpp"
#include "bytepath/systems/projectile_death.hpp"
#include "bytepath/systems/projectile_spawn.hpp"
#include "bytepath/systems/shooting_effect.hpp"
#include "bytepath/systems/tick_effect.hpp"
#include "bytepath/systems/trail_effect.hpp"

namespace {
const char* const EventsStage = "events";
const char* const GameStage = "game";

std::chrono::nanoseconds toNanoseconds(float seconds) {
    return std::chrono::round<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
}
}

Game::Game() : Game(GameConfig{}) {}

Game::Game(const GameConfig& config) : ctx(config) {
    createSystems();
}

Game::~Game() = default;

void Game::createSystems() {
    using namespace Systems;

    schedule.addStartupSystem(std::make_unique<PlayerSpawnSystem>());

    schedule.addStage(EventsStage);
    schedule.addStageAfter(EventsStage, GameStage);

    schedule.addSystem(EventsStage, std::make_unique<EventUpdateSystem>());

    schedule.addSystem(GameStage, std::make_unique<BoostSystem>());
    schedule.addSystem(GameStage, std::make_unique<PlayerSystem>(), {"boost_system"});
    schedule.addSystem(GameStage, std::make_unique<PlayerRespawnSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<CameraShakeSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<FlashSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<ExplosionSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<ProjectileSpawnSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<ShootingEffectSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<ProjectileSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<ProjectileDeathSystem>(), {"projectile_system"});
    schedule.addSystem(GameStage, std::make_unique<TickEffectSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<TrailEffectSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<PickupSpawnSystem>());
    schedule.addSystem(GameStage, std::make_unique<PickupSystem>(), {"player_system"});
    schedule.addSystem(GameStage, std::make_unique<PickupCaptureSystem>(), {"pickup_system"});
    schedule.addSystem(GameStage, std::make_unique<LineParticleSystem>(), {"explosion_system"});
}

void Game::startup() {
    if (schedule.hasRunStartup()) {
        return;
    }
    if (!(ctx.config.MaxStepSeconds > 0.0f)) {
        throw std::invalid_argument("Game::startup: MaxStepSeconds must be positive");
    }
    std::cout << "Game::startup()" << std::endl;

    deathReader = ctx.events.registerReader();
    schedule.initialize(registry, ctx);
    schedule.runStartup(registry, ctx);
}

void Game::setPressedKeys(const Resources::Keycodes& keys) {
    ctx.keys = keys;
}

int Game::advanceFrame(float seconds) {
    PROFILE_SCOPE("Game::advanceFrame");

    // Whole nanoseconds, so the slices always sum to the frame exactly
    std::chrono::nanoseconds const maxStep = toNanoseconds(ctx.config.MaxStepSeconds);
    if (maxStep <= std::chrono::nanoseconds::zero()) {
        throw std::invalid_argument("Game::advanceFrame: MaxStepSeconds must be positive");
    }

    int steps = 0;
    std::chrono::nanoseconds remaining = toNanoseconds(seconds);
    while (remaining > std::chrono::nanoseconds::zero()) {
        std::chrono::nanoseconds const slice = std::min(remaining, maxStep);
        step(std::chrono::duration<float>(slice).count());
        remaining -= slice;
        ++steps;
    }
    DebugStats::printStepStats();
    return steps;
}

void Game::step(float rawDelta) {
    PROFILE_SCOPE("Game::step");

    // Must run before the events stage clears the previous step's events
    bool deathOccurred = false;
    for (const auto& event : ctx.events.read(deathReader)) {
        if (event.type == GameEventType::PlayerDeath) {
            deathOccurred = true;
        }
    }

    ctx.time.raw = rawDelta;
    ctx.time.scaled = ctx.dilation.advance(rawDelta, deathOccurred);
    ctx.spawnTimers.tick(ctx.time.scaled);

    schedule.run(registry, ctx);

    DebugStats::recordStep();
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Game::step raw=" << ctx.time.raw
              << " scaled=" << ctx.time.scaled << "\n");
}

entt::registry& Game::getRegistry() {
    return registry;
}

const entt::registry& Game::getRegistry() const {
    return registry;
}
