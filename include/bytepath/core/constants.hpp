#ifndef BYTEPATH_CONSTANTS_HPP
#define BYTEPATH_CONSTANTS_HPP

#include <cstdint>
#include <SFML/Graphics/Color.hpp>

namespace GameConstants {

    // Truly global constants
    extern const float Pi;
    extern const float TwoPi;
    extern const float Epsilon;

    // Logical screen, in pixels. Everything in the simulation lives in this space.
    extern const float ScreenWidth;
    extern const float ScreenHeight;

    /**
     * @brief Draw order. Lower values are drawn first.
     */
    namespace ZIndex {
        extern const std::uint8_t TrailEffect;
        extern const std::uint8_t Pickup;
        extern const std::uint8_t Projectile;
        extern const std::uint8_t DeadProjectile;
        extern const std::uint8_t Player;
        extern const std::uint8_t ShootingEffect;
        extern const std::uint8_t TickEffect;
        extern const std::uint8_t LineParticle;
        extern const std::uint8_t Flash;
    }

    namespace Colors {
        extern const sf::Color Background;
        extern const sf::Color Default;
        extern const sf::Color Boost;
        extern const sf::Color NonBoost;
        extern const sf::Color Death;
        extern const sf::Color Ammunition;
        extern const sf::Color Flash;
    }

    // Utility
    float normalizeAngle(float radians);
}

#endif // BYTEPATH_CONSTANTS_HPP
