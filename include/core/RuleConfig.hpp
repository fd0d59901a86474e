#pragma once

#include "Types.hpp"

namespace snake_escape::core {

// Tunable rules of a session. Defaults match the shipped levels.
struct RuleConfig {
    SnakeColor reversibleColor{SnakeColor::Red}; // may move its tail end
    SnakeColor wrappingColor{SnakeColor::Green}; // crosses board edges toroidally

    int maxSlideSteps{50}; // bounds ice slides between facing portals

    bool respawnFruitOnExit{true}; // exit cell turns into a fruit for the remaining snakes
};

} // namespace snake_escape::core
