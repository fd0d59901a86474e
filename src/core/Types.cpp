#include "core/Types.hpp"

namespace snake_escape::core {

const char* toString(SnakeColor color) noexcept {
    switch (color) {
    case SnakeColor::Red:    return "Red";
    case SnakeColor::Green:  return "Green";
    case SnakeColor::Blue:   return "Blue";
    case SnakeColor::Yellow: return "Yellow";
    }
    return "?";
}

const char* toString(GroupColor color) noexcept {
    switch (color) {
    case GroupColor::Yellow: return "Yellow";
    case GroupColor::Purple: return "Purple";
    case GroupColor::Orange: return "Orange";
    }
    return "?";
}

const char* toString(SnakeEnd end) noexcept {
    return end == SnakeEnd::Head ? "head" : "tail";
}

} // namespace snake_escape::core
