#pragma once

#include "Types.hpp"
#include <vector>

namespace snake_escape::core {

// Typed level records handed over by the level loader. The core does not
// parse any file format; it only consumes these.

struct SnakeSpec {
    SnakeColor color{};
    std::vector<Cell> body; // head first
};

struct ExitSpec {
    SnakeColor color{};
    int minLength{1};
    Cell position;
};

struct FruitSpec {
    std::vector<SnakeColor> colors;
    Cell position;
};

struct GroupedSpec {
    GroupColor color{};
    Cell position;
};

using PlateSpec     = GroupedSpec;
using LiftGateSpec  = GroupedSpec;
using LaserGateSpec = GroupedSpec;

struct PortalSpec {
    PortalGroup group{};
    Cell position;
};

struct LevelData {
    int width{};
    int height{};

    std::vector<Cell> walls;
    std::vector<std::vector<Cell>> boxes;    // one footprint per box
    std::vector<std::vector<Cell>> iceCubes; // one footprint per cube
    std::vector<Cell> holes;

    std::vector<SnakeSpec> snakes;
    std::vector<ExitSpec> exits;
    std::vector<FruitSpec> fruits;

    std::vector<PlateSpec> plates;
    std::vector<LiftGateSpec> liftGates;
    std::vector<LaserGateSpec> laserGates;

    std::vector<PortalSpec> portals;
};

} // namespace snake_escape::core
