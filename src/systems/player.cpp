#include "bytepath/systems/player.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/bounds.hpp"

#include <iostream>

namespace Systems {

std::optional<entt::entity> findPlayer(entt::registry& registry) {
    auto view = registry.view<Components::Player>();
    if (view.size() != 1) {
        return std::nullopt;
    }
    return *view.begin();
}

void PlayerSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("PlayerSystem");

    float const dt = ctx.time.scaled;
    bool const left = ctx.isPressed(gameConfig.Keys.rotateLeft);
    bool const right = ctx.isPressed(gameConfig.Keys.rotateRight);
    bool const deathKey = ctx.isPressed(gameConfig.Keys.death);

    auto view = registry.view<Components::Player, Components::Position,
                              Components::Angle, Components::Velocity>();
    for (auto [entity, player, pos, angle, vel] : view.each()) {
        if (left) {
            angle.radians += angle.rotationSpeed * dt;
        }
        if (right) {
            angle.radians -= angle.rotationSpeed * dt;
        }
        angle.radians = GameConstants::normalizeAngle(angle.radians);

        pos += Vector::fromAngle(angle.radians) * (vel.current * dt);

        float halfX = 0.0f;
        float halfY = 0.0f;
        if (auto* geometry = registry.try_get<Components::Geometry>(entity)) {
            geometry->rotation = angle.radians;
            halfX = geometry->halfExtentX();
            halfY = geometry->halfExtentY();
        }

        if (deathKey || isOutsideScreen(pos, halfX, halfY, gameConfig)) {
            ctx.commands.despawn(entity);
            ctx.events.send(GameEvent{GameEventType::PlayerDeath, pos});
            std::cout << "PlayerSystem: player died at ("
                      << pos.x << ", " << pos.y << ")" << std::endl;
        }
    }
}

SystemAccess PlayerSystem::access() const {
    return SystemAccess{}
        .read<Resources::Keycodes, Resources::FrameTime, Components::Player, Components::Velocity>()
        .write<Components::Position, Components::Angle, Components::Geometry,
               EventChannel<GameEvent>>();
}

} // namespace Systems
