#include "core/Move.hpp"

namespace snake_escape::core {

const char* toString(MoveStatus status) noexcept {
    switch (status) {
    case MoveStatus::Ok:                  return "Ok";
    case MoveStatus::Queued:              return "Queued";
    case MoveStatus::AnimationInProgress: return "AnimationInProgress";
    case MoveStatus::IllegalEnd:          return "IllegalEnd";
    case MoveStatus::NotAdjacent:         return "NotAdjacent";
    case MoveStatus::Obstructed:          return "Obstructed";
    case MoveStatus::InteractionDenied:   return "InteractionDenied";
    case MoveStatus::UnknownSnake:        return "UnknownSnake";
    }
    return "?";
}

} // namespace snake_escape::core
