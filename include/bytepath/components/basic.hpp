#ifndef BYTEPATH_COMPONENTS_BASIC_HPP
#define BYTEPATH_COMPONENTS_BASIC_HPP

#include <cstdint>
#include <optional>
#include <SFML/Graphics/Color.hpp>
#include "bytepath/math/vector_math.hpp"

namespace Components {

    // Screen-space location in pixels
    using Position = ::Vector;

    // Heading in radians plus turn rate in radians per second
    struct Angle {
        float radians = 0.0f;
        float rotationSpeed = 0.0f;
    };

    // Spin about the entity's own centre, independent of its heading
    struct CenterRotation {
        float radians = 0.0f;
        float speed = 0.0f;
    };

    // Speed along the heading. current is reset to base every step unless
    // a system modifies it again (boost, slow).
    struct Velocity {
        float base = 0.0f;
        float current = 0.0f;

        Velocity() = default;
        explicit Velocity(float speed) : base(speed), current(speed) {}
    };

    enum class ShapeType {
        Circle,          // width = diameter
        Box,             // filled rectangle
        BoxOutline,      // stroked rectangle
        Diamond          // rotated square outline with a filled core
    };

    // Drawable shape descriptor consumed by the tessellation collaborator.
    // The simulation only writes scale, rotation, color and frame.
    struct Geometry {
        ShapeType shape = ShapeType::Box;
        float width = 1.0f;
        float height = 1.0f;
        float scaleX = 1.0f;
        float scaleY = 1.0f;
        float rotation = 0.0f;
        std::uint8_t zIndex = 0;
        sf::Color color = sf::Color::White;
        int frame = 0;

        float halfExtentX() const { return width * scaleX * 0.5f; }
        float halfExtentY() const { return height * scaleY * 0.5f; }
    };

    // Movement lives in Angle and Velocity; this holds what only the ship has
    struct Player {
        int ammo = 100;
        int maxAmmo = 100;
    };

    // Boost energy carried by the player entity
    struct Boost {
        float max = 100.0f;
        float current = 100.0f;
        std::optional<float> cooldown;   // seconds left before boosting is allowed again
        float incAmount = 10.0f;         // regeneration per second
        float decAmount = 50.0f;         // drain per second while boosting
        float cooldownSeconds = 2.0f;
        bool boosting = false;

        bool canBoost() const { return !cooldown.has_value() && current > 0.0f; }
    };

    // Keeps an effect glued to the player, `distance` pixels ahead of its centre
    struct FollowPlayer {
        float distance = 0.0f;
    };

    // Tags
    struct Projectile {};
    struct TrailEffect {};
    struct TickEffect {};
    struct ShootingEffect {};
    struct AmmoPickup {};
    struct BoostPickup {};

} // namespace Components

#endif
