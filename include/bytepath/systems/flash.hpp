/**
 * @file flash.hpp
 * @brief Full-screen flash after a player death
 *
 * A PlayerDeath loads GameConfig::FlashFrames into the counter. Each step
 * with a positive counter shows the flash and decrements; at zero the flash
 * resource returns to its default (hidden).
 */

#pragma once

#include "bytepath/core/events.hpp"
#include "bytepath/systems/i_system.hpp"

namespace Systems {

class FlashSystem : public ISystem {
public:
    std::string name() const override { return "flash_system"; }
    void setup(entt::registry& registry, GameContext& ctx) override;
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;

private:
    ReaderId deathReader;
};

} // namespace Systems
