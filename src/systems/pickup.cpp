#include "bytepath/systems/pickup.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/profile.hpp"
#include "bytepath/systems/bounds.hpp"
#include "bytepath/systems/player.hpp"

#include <algorithm>

namespace Systems {

float boundedTurn(float heading, const Vector& toTarget, float maxTurn) {
    float const steer = signedSteeringAngle(heading, toTarget);
    return std::clamp(steer, -maxTurn, maxTurn);
}

void PickupSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("PickupSystem");

    float const dt = ctx.time.scaled;

    std::optional<Vector> playerPos;
    if (auto player = findPlayer(registry)) {
        playerPos = registry.get<Components::Position>(*player);
    }

    auto view = registry.view<Components::Position, Components::Angle, Components::Velocity,
                              Components::CenterRotation, Components::Geometry>(
        entt::exclude<Components::Capturing>);

    for (auto [entity, pos, angle, vel, spin, geometry] : view.each()) {
        bool const isAmmo = registry.all_of<Components::AmmoPickup>(entity);
        if (!isAmmo && !registry.all_of<Components::BoostPickup>(entity)) {
            continue;
        }

        spin.radians = GameConstants::normalizeAngle(spin.radians + spin.speed * dt);
        geometry.rotation = spin.radians;

        if (isAmmo && playerPos) {
            angle.radians += boundedTurn(angle.radians, *playerPos - pos, angle.rotationSpeed * dt);
            angle.radians = GameConstants::normalizeAngle(angle.radians);
        }

        pos += Vector::fromAngle(angle.radians) * (vel.current * dt);

        if (playerPos && pos.distance(*playerPos) <= specificConfig.triggerRadius) {
            Components::Capturing capturing;
            capturing.timer = Timer(specificConfig.captureSeconds, false);
            capturing.kind = isAmmo ? Components::PickupKind::Ammo : Components::PickupKind::Boost;
            ctx.commands.insert<Components::Capturing>(entity, capturing);
            continue;
        }

        if (isOutsideScreen(pos, geometry.halfExtentX(), geometry.halfExtentY(), gameConfig)) {
            ctx.commands.despawn(entity);
        }
    }
}

SystemAccess PickupSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Player, Components::Velocity,
              Components::AmmoPickup, Components::BoostPickup>()
        .write<Components::Position, Components::Angle, Components::CenterRotation,
               Components::Geometry>();
}

} // namespace Systems
