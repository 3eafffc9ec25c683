/**
 * @file bounds.hpp
 * @brief Screen boundary tests shared by the lifecycle systems
 *
 * One convention everywhere: an entity is out of bounds once its bounding
 * box has fully left the screen. Projectiles are treated as points.
 */

#ifndef BYTEPATH_BOUNDS_HPP
#define BYTEPATH_BOUNDS_HPP

#include "bytepath/core/game_config.hpp"
#include "bytepath/math/vector_math.hpp"

namespace Systems {

/**
 * @brief True once a box centred at pos with the given half extents no
 *        longer overlaps the screen
 */
bool isOutsideScreen(const Vector& pos, float halfExtentX, float halfExtentY,
                     const GameConfig& config);

/**
 * @brief Clamps a point into [0, width] x [0, height]
 */
Vector clampToScreen(const Vector& pos, const GameConfig& config);

} // namespace Systems

#endif
