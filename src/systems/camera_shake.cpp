#include "bytepath/systems/camera_shake.hpp"
#include "bytepath/core/debug.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

void CameraShakeSystem::setup(entt::registry& registry, GameContext& ctx) {
    (void)registry;
    deathReader = ctx.events.registerReader();
}

void CameraShakeSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("CameraShakeSystem");
    (void)registry;

    for (const auto& event : ctx.events.read(deathReader)) {
        if (event.type == GameEventType::PlayerDeath) {
            ctx.shake.start(ctx.random.engine);
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "CameraShakeSystem: shake started\n");
        }
    }

    Vector const offset = ctx.shake.advance(ctx.time.raw);
    ctx.camera.x = offset.x;
    ctx.camera.y = offset.y;
}

SystemAccess CameraShakeSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, EventChannel<GameEvent>>()
        .write<Resources::ShakeGenerator, Resources::Camera, Resources::Random>();
}

} // namespace Systems
