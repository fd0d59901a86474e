#pragma once

#include "Types.hpp"
#include <cstdint>

namespace snake_escape::core {

struct MoveRequest {
    SnakeId snakeId{};
    SnakeEnd end{SnakeEnd::Head};
    Cell target;
};

enum class MoveStatus : std::uint8_t {
    Ok,
    Queued,              // accepted for later execution (re-entrant request)
    AnimationInProgress, // presentation busy, retry later
    IllegalEnd,          // tail move by a snake that cannot reverse
    NotAdjacent,
    Obstructed,
    InteractionDenied,   // an entity's entry rule refused the mover
    UnknownSnake
};

struct MoveResult {
    MoveStatus status{MoveStatus::Ok};

    bool accepted() const noexcept { return status == MoveStatus::Ok; }
};

const char* toString(MoveStatus status) noexcept;

} // namespace snake_escape::core
