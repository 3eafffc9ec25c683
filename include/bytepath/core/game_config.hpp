/**
 * @file game_config.hpp
 * @brief Shared tunables for a game instance.
 */

#pragma once

#include <cstdint>
#include <SFML/Window/Keyboard.hpp>
#include "bytepath/core/constants.hpp"
#include "bytepath/core/shake.hpp"

/**
 * @struct KeyBindings
 * @brief Which key symbols the systems react to
 */
struct KeyBindings {
    sf::Keyboard::Key rotateLeft = sf::Keyboard::Left;
    sf::Keyboard::Key rotateRight = sf::Keyboard::Right;
    sf::Keyboard::Key boost = sf::Keyboard::Up;
    sf::Keyboard::Key slow = sf::Keyboard::Down;
    sf::Keyboard::Key altFire = sf::Keyboard::Space;
    sf::Keyboard::Key death = sf::Keyboard::K;
};

/**
 * @struct ShipConfig
 * @brief Initial state of a freshly spawned ship, at startup and on respawn
 */
struct ShipConfig {
    float movementSpeed = 100.0f;                        // pixels per second
    float rotationSpeed = 1.66f * GameConstants::Pi;     // radians per second
    float startAngle = -GameConstants::Pi / 2.0f;        // facing up
    float size = 24.0f;                                  // diameter in pixels
    int maxAmmo = 100;

    float boostMax = 100.0f;
    float boostIncAmount = 10.0f;
    float boostDecAmount = 50.0f;
    float boostCooldownSeconds = 2.0f;
};

/**
 * @struct GameConfig
 * @brief Holds the configuration shared by the frame loop and all systems.
 *
 * Every system receives a copy through ISystem::setGameConfig. Per-system
 * tunables live in each system's own config struct instead.
 */
struct GameConfig {
    float ScreenWidth;
    float ScreenHeight;

    // Upper bound on a single simulation step; longer frames are sliced
    float MaxStepSeconds = 1.0f / 60.0f;

    // Slow motion after a player death
    float SlowDownDurationSeconds = 2.5f;
    float SlowDownMinimumSpeed = 0.15f;

    // Periodic spawners (scaled time)
    float ProjectileSpawnSeconds = 0.25f;
    float TickEffectSpawnSeconds = 5.0f;
    float AmmoPickupSpawnSeconds = 1.0f;
    float BoostPickupSpawnSeconds = 2.0f;

    // Delay before a dead player is replaced (scaled time)
    float PlayerRespawnSeconds = 3.0f;

    // Full-screen flash length in steps
    int FlashFrames = 4;

    Resources::ShakeConfig Shake;

    ShipConfig Ship;

    std::uint32_t RandomSeed = 5489u;

    KeyBindings Keys;

    GameConfig();
};
