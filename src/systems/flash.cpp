#include "bytepath/systems/flash.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

void FlashSystem::setup(entt::registry& registry, GameContext& ctx) {
    (void)registry;
    deathReader = ctx.events.registerReader();
}

void FlashSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("FlashSystem");
    (void)registry;

    for (const auto& event : ctx.events.read(deathReader)) {
        if (event.type == GameEventType::PlayerDeath) {
            ctx.flash.framesLeft = gameConfig.FlashFrames;
        }
    }

    if (ctx.flash.framesLeft > 0) {
        ctx.flash.visible = true;
        --ctx.flash.framesLeft;
    } else {
        ctx.flash = Resources::Flash{};
    }
}

SystemAccess FlashSystem::access() const {
    return SystemAccess{}
        .read<EventChannel<GameEvent>>()
        .write<Resources::Flash>();
}

} // namespace Systems
