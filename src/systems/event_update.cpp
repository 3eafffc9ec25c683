#include "bytepath/systems/event_update.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

void EventUpdateSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("EventUpdateSystem");
    (void)registry;
    DebugStats::recordEvents(ctx.events.size());
    ctx.events.update();
}

SystemAccess EventUpdateSystem::access() const {
    return SystemAccess{}.write<EventChannel<GameEvent>>();
}

} // namespace Systems
