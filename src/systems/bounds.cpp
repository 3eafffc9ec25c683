#include "bytepath/systems/bounds.hpp"
#include <algorithm>

namespace Systems {

bool isOutsideScreen(const Vector& pos, float halfExtentX, float halfExtentY,
                     const GameConfig& config)
{
    return pos.x + halfExtentX < 0.0f
        || pos.x - halfExtentX > config.ScreenWidth
        || pos.y + halfExtentY < 0.0f
        || pos.y - halfExtentY > config.ScreenHeight;
}

Vector clampToScreen(const Vector& pos, const GameConfig& config) {
    return {std::clamp(pos.x, 0.0f, config.ScreenWidth),
            std::clamp(pos.y, 0.0f, config.ScreenHeight)};
}

} // namespace Systems
