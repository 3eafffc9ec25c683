/**
 * @file boost.hpp
 * @brief Boost energy and speed modifiers of the player ship
 *
 * This system handles:
 * - Resetting Velocity::current to base every step
 * - Draining boost while the boost key is held and boosting is allowed
 * - Regenerating boost toward max otherwise
 * - Starting the empty-tank cooldown
 * - Slowing the ship while the slow key is held
 *
 * Required components:
 * - Player, Boost (to modify), Velocity (to modify)
 */

#ifndef BYTEPATH_BOOST_SYSTEM_HPP
#define BYTEPATH_BOOST_SYSTEM_HPP

#include "bytepath/systems/i_system.hpp"

namespace Systems {

struct BoostConfig {
    float boostMultiplier = 1.5f;
    float slowMultiplier = 0.5f;
};

class BoostSystem : public ConfigurableSystem<BoostConfig> {
public:
    std::string name() const override { return "boost_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems

#endif
