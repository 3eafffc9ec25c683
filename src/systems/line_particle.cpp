#include "bytepath/systems/line_particle.hpp"
#include "bytepath/components/basic.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/interpolation.hpp"
#include "bytepath/core/profile.hpp"

namespace Systems {

void LineParticleSystem::update(entt::registry& registry, GameContext& ctx) {
    PROFILE_SCOPE("LineParticleSystem");

    float const dt = ctx.time.scaled;
    auto view = registry.view<Components::LineParticle, Components::Position,
                              Components::Angle, Components::Interpolation>();
    for (auto [entity, particle, pos, angle, interpolation] : view.each()) {
        auto result = interpolation.eval(dt);
        particle.speed = result.values[0];
        particle.width = result.values[1];

        pos += Vector::fromAngle(angle.radians) * (particle.speed * dt);

        if (result.finished) {
            ctx.commands.despawn(entity);
        }
    }
}

SystemAccess LineParticleSystem::access() const {
    return SystemAccess{}
        .read<Resources::FrameTime, Components::Angle>()
        .write<Components::LineParticle, Components::Position, Components::Interpolation>();
}

} // namespace Systems
