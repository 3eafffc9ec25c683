#pragma once

#include "bytepath/systems/i_system.hpp"

namespace Systems {

/**
 * @class EventUpdateSystem
 * @brief Clears the event channel at the start of every step
 *
 * Runs alone in the "events" stage, so an event lives from its send() until
 * the next step begins.
 */
class EventUpdateSystem : public ISystem {
public:
    std::string name() const override { return "event_update_system"; }
    void update(entt::registry& registry, GameContext& ctx) override;
    SystemAccess access() const override;
};

} // namespace Systems
