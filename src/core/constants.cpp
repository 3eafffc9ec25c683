#include "bytepath/core/constants.hpp"
#include <cmath>

namespace GameConstants {

    const float Pi      = 3.14159265358979f;
    const float TwoPi   = 2.0f * Pi;
    const float Epsilon = 1e-6f;

    // Display
    const float ScreenWidth  = 480.0f;
    const float ScreenHeight = 270.0f;

    namespace ZIndex {
        const std::uint8_t TrailEffect    = 5;
        const std::uint8_t Pickup         = 8;
        const std::uint8_t Projectile     = 9;
        const std::uint8_t DeadProjectile = 9;
        const std::uint8_t Player         = 10;
        const std::uint8_t ShootingEffect = 12;
        const std::uint8_t TickEffect     = 15;
        const std::uint8_t LineParticle   = 20;
        const std::uint8_t Flash          = 255;
    }

    namespace Colors {
        const sf::Color Background(16, 16, 16);
        const sf::Color Default(222, 222, 222);
        const sf::Color Boost(76, 195, 217);
        const sf::Color NonBoost(255, 198, 93);
        const sf::Color Death(241, 103, 69);
        const sf::Color Ammunition(123, 200, 164);
        const sf::Color Flash(222, 222, 222);
    }

    float normalizeAngle(float radians) {
        float wrapped = std::fmod(radians, TwoPi);
        if (wrapped < 0.0f) {
            wrapped += TwoPi;
        }
        return wrapped;
    }

} // namespace GameConstants
