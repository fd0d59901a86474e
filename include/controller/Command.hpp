#pragma once

#include "core/Types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace snake_escape::controller {

// Discrete console commands. Parsing is UI-agnostic; the controller maps
// them onto session requests.

struct MoveCommand {
    core::SnakeId snakeId{};
    core::SnakeEnd end{core::SnakeEnd::Head};
    core::Cell target;
};

// Move whichever snake end sits at `from` (heads first) to `to`
struct DragCommand {
    core::Cell from;
    core::Cell to;
};

struct ReloadCommand {};

struct BusyCommand {
    bool busy{};
};

struct HelpCommand {};
struct QuitCommand {};

using Command = std::variant<
    MoveCommand,
    DragCommand,
    ReloadCommand,
    BusyCommand,
    HelpCommand,
    QuitCommand
>;

// Accepted forms (case-insensitive keywords):
//   move <snake> head|tail <x> <y>   (alias: m)
//   drag <x1> <y1> <x2> <y2>         (alias: d)
//   reload | r
//   busy on|off
//   help | h | ?
//   quit | q
// Returns std::nullopt for anything else.
std::optional<Command> parseCommand(const std::string& line);

} // namespace snake_escape::controller
