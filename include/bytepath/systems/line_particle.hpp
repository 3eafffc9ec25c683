/**
 * @file line_particle.hpp
 * @brief Moves and fades explosion line particles
 *
 * Interpolation values are (speed, width). The particle advances along its
 * Angle by the interpolated speed and despawns when the tween finishes.
 */

#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

class LineParticleSystem : public ISystem {
public:
    std::string name() const override { return "line_particle_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
