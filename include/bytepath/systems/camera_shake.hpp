/**
 * @file camera_shake.hpp
 * @brief Drives the camera offset from the shake generator
 *
 * A PlayerDeath starts a fresh shake. Every step the generator advances by
 * the raw (undilated) step time and its offset becomes the camera position.
 */

#pragma once

#include "bytepath/core/events.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

class CameraShakeSystem : public ISystem {
public:
    std::string name() const override { return "camera_shake_system"; }
    void setup(entt::registry& registry, GameContext& ctx) override;
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;

private:
    ReaderId deathReader;
};

} // namespace Systems
