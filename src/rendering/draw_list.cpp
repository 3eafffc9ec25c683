#include "bytepath/rendering/draw_list.hpp"
#include "bytepath/components/effects.hpp"
#include "bytepath/core/constants.hpp"
#include "bytepath/core/profile.hpp"

#include <algorithm>

namespace Rendering {

std::vector<DrawCommand> buildDrawList(const entt::registry& registry, const GameContext& ctx) {
    PROFILE_SCOPE("Rendering::buildDrawList");

    Vector const cameraOffset(ctx.camera.x, ctx.camera.y);
    std::vector<DrawCommand> commands;

    auto shapes = registry.view<const Components::Position, const Components::Geometry>();
    for (auto [entity, pos, geometry] : shapes.each()) {
        DrawCommand cmd;
        cmd.kind = DrawKind::Shape;
        cmd.shape = geometry.shape;
        cmd.center = pos + cameraOffset;
        cmd.width = geometry.width;
        cmd.height = geometry.height;
        cmd.scaleX = geometry.scaleX;
        cmd.scaleY = geometry.scaleY;
        cmd.rotation = geometry.rotation;
        cmd.zIndex = geometry.zIndex;
        cmd.color = geometry.color;
        cmd.frame = geometry.frame;
        cmd.entity = entity;
        commands.push_back(cmd);
    }

    auto lines = registry.view<const Components::Position, const Components::Angle,
                               const Components::LineParticle>();
    for (auto [entity, pos, angle, particle] : lines.each()) {
        DrawCommand cmd;
        cmd.kind = DrawKind::Line;
        cmd.center = pos + cameraOffset;
        cmd.width = particle.width;
        cmd.height = particle.length;
        cmd.rotation = angle.radians;
        cmd.zIndex = GameConstants::ZIndex::LineParticle;
        cmd.color = particle.color;
        cmd.entity = entity;
        commands.push_back(cmd);
    }

    std::stable_sort(commands.begin(), commands.end(),
                     [](const DrawCommand& a, const DrawCommand& b) { return a.zIndex < b.zIndex; });

    if (ctx.flash.visible) {
        DrawCommand flash;
        flash.kind = DrawKind::Shape;
        flash.shape = Components::ShapeType::Box;
        flash.center = Vector(ctx.config.ScreenWidth / 2.0f, ctx.config.ScreenHeight / 2.0f);
        flash.width = ctx.config.ScreenWidth;
        flash.height = ctx.config.ScreenHeight;
        flash.zIndex = GameConstants::ZIndex::Flash;
        flash.color = GameConstants::Colors::Flash;
        commands.push_back(flash);
    }

    return commands;
}

} // namespace Rendering
