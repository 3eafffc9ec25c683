#pragma once

#include <SFML/Graphics/Color.hpp>
#include "bytepath/core/timer.hpp"

namespace Components {

    // Two-frame impact animation left behind by a projectile that hit a wall.
    // Frame 0 is shown until frameSwitchSeconds, frame 1 until the timer ends.
    struct DeadProjectile {
        Timer timer;
        float frameSwitchSeconds = 0.1f;
    };

    enum class PickupKind {
        Ammo,
        Boost
    };

    // A pickup inside the player's trigger radius, playing its capture pulse
    struct Capturing {
        Timer timer;
        PickupKind kind = PickupKind::Ammo;
    };

    // Straight line segment flying outward from an explosion. Its Position is
    // the segment centre and its Angle the flight direction.
    struct LineParticle {
        float speed = 0.0f;
        float length = 0.0f;
        float width = 2.0f;
        sf::Color color = sf::Color::White;
    };

} // namespace Components
