#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <cstdlib> // For std::abs
#include <functional> // For std::hash

// Namespace for Snake Escape core types
namespace snake_escape::core {

// Cell coordinate on the board, origin bottom-left
struct Cell {
    int x{};
    int y{};
};

inline bool operator==(Cell a, Cell b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Cell a, Cell b) noexcept { return !(a == b); }
inline Cell operator+(Cell a, Cell b) noexcept { return Cell{a.x + b.x, a.y + b.y}; }
inline Cell operator-(Cell a, Cell b) noexcept { return Cell{a.x - b.x, a.y - b.y}; }

inline int manhattan(Cell a, Cell b) noexcept {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

struct CellHash {
    std::size_t operator()(Cell c) const noexcept {
        return std::hash<long long>{}((static_cast<long long>(c.x) << 32) ^ static_cast<unsigned>(c.y));
    }
};

// Which end of a snake is moving
enum class SnakeEnd : std::uint8_t {
    Head,
    Tail
};

// Snake colors; some colors carry movement abilities (see RuleConfig)
enum class SnakeColor : std::uint8_t {
    Red,
    Green,
    Blue,
    Yellow
};

// Colors partitioning pressure plates and the gates they drive
enum class GroupColor : std::uint8_t {
    Yellow,
    Purple,
    Orange
};

using EntityId    = std::uint32_t;
using SnakeId     = std::uint32_t;
using PortalGroup = int;

const char* toString(SnakeColor color) noexcept;
const char* toString(GroupColor color) noexcept;
const char* toString(SnakeEnd end) noexcept;

} // namespace snake_escape::core
