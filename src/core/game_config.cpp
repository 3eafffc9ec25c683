#include "bytepath/core/game_config.hpp"
#include "bytepath/core/constants.hpp"

GameConfig::GameConfig()
    : ScreenWidth(GameConstants::ScreenWidth)
    , ScreenHeight(GameConstants::ScreenHeight)
{
}
