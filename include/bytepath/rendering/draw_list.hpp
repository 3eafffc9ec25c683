/**
 * @file draw_list.hpp
 * @brief Flattens the simulation state into z-ordered shape commands
 *
 * The tessellation collaborator consumes DrawCommands in order. Every
 * entity with a Geometry and a Position becomes one command; every line
 * particle becomes a Line command. Positions are offset by the camera.
 * While the flash is visible a full-screen Flash box closes the list.
 */

#pragma once

#include <cstdint>
#include <vector>
#include <SFML/Graphics/Color.hpp>
#include <entt/entt.hpp>
#include "bytepath/components/basic.hpp"
#include "bytepath/core/game_context.hpp"

namespace Rendering {

enum class DrawKind {
    Shape,  // Geometry-backed entity
    Line    // line particle: width x length along `rotation`
};

struct DrawCommand {
    DrawKind kind = DrawKind::Shape;
    Components::ShapeType shape = Components::ShapeType::Box;
    Vector center;
    float width = 0.0f;
    float height = 0.0f;
    float scaleX = 1.0f;
    float scaleY = 1.0f;
    float rotation = 0.0f;
    std::uint8_t zIndex = 0;
    sf::Color color;
    int frame = 0;
    entt::entity entity = entt::null;
};

/**
 * @brief Builds the draw list for the current state
 *
 * Commands are sorted by zIndex; equal z-indices keep registry order.
 */
std::vector<DrawCommand> buildDrawList(const entt::registry& registry, const GameContext& ctx);

} // namespace Rendering
