#include "bytepath/systems/boost.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/profile.hpp"

#include <algorithm>

namespace Systems {

void BoostSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("BoostSystem");

    float const dt = ctx.time.scaled;
    bool const boostHeld = ctx.isPressed(gameConfig.Keys.boost);
    bool const slowHeld = ctx.isPressed(gameConfig.Keys.slow);

    auto view = registry.view<Components::Player, Components::Boost, Components::Velocity>();
    for (auto [entity, player, boost, vel] : view.each()) {
        vel.current = vel.base;

        // The cooldown runs out on its own, whatever the boost level
        if (boost.cooldown) {
            *boost.cooldown -= dt;
            if (*boost.cooldown <= 0.0f) {
                boost.cooldown.reset();
            }
        }

        if (boostHeld && boost.canBoost()) {
            boost.boosting = true;
            boost.current -= boost.decAmount * dt;
            vel.current = vel.base * specificConfig.boostMultiplier;

            if (boost.current <= 0.0f) {
                boost.current = 0.0f;
                if (!boost.cooldown) {
                    boost.cooldown = boost.cooldownSeconds;
                    DEBUG_MSG(DEBUG_LEVEL_BASIC, "BoostSystem: boost empty, cooling down for "
                              << boost.cooldownSeconds << "s\n");
                }
            }
        } else {
            boost.boosting = false;
            boost.current = std::min(boost.max, boost.current + boost.incAmount * dt);
            if (slowHeld) {
                vel.current = vel.base * specificConfig.slowMultiplier;
            }
        }
    }
}

SystemAccess BoostSystem::access() const {
    return SystemAccess{}
        .read<Resources::Keycodes, Resources::FrameTime, Components::Player>()
        .write<Components::Boost, Components::Velocity>();
}

} // namespace Systems
