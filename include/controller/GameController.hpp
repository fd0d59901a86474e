#pragma once

#include "core/GameSession.hpp"
#include "controller/Command.hpp"

#include <optional>

namespace snake_escape::controller {

class GameController {
public:
    /// Controller does not own the session; caller keeps it alive.
    explicit GameController(core::GameSession& session);

    /// Handle a single command. Move-type commands return the session's
    /// answer; other commands return std::nullopt.
    std::optional<core::MoveResult> handleCommand(const Command& command);

    bool quitRequested() const noexcept { return quit_; }

private:
    core::GameSession& session_;
    bool quit_{false};
};

} // namespace snake_escape::controller
