#include "controller/GameController.hpp"

namespace snake_escape::controller {

namespace {

struct Dispatch {
    core::GameSession& session;
    bool& quit;

    std::optional<core::MoveResult> operator()(const MoveCommand& c) const {
        return session.requestMove(core::MoveRequest{c.snakeId, c.end, c.target});
    }

    std::optional<core::MoveResult> operator()(const DragCommand& c) const {
        const auto end = session.snakeEndAt(c.from);
        if (!end) {
            return core::MoveResult{core::MoveStatus::UnknownSnake};
        }
        return session.requestMove(core::MoveRequest{end->snakeId, end->end, c.to});
    }

    std::optional<core::MoveResult> operator()(const ReloadCommand&) const {
        session.reloadLevel();
        return std::nullopt;
    }

    std::optional<core::MoveResult> operator()(const BusyCommand& c) const {
        session.setPresentationBusy(c.busy);
        return std::nullopt;
    }

    std::optional<core::MoveResult> operator()(const HelpCommand&) const {
        return std::nullopt;
    }

    std::optional<core::MoveResult> operator()(const QuitCommand&) const {
        quit = true;
        return std::nullopt;
    }
};

} // namespace

GameController::GameController(core::GameSession& session)
    : session_{session}
{
}

std::optional<core::MoveResult> GameController::handleCommand(const Command& command) {
    return std::visit(Dispatch{session_, quit_}, command);
}

} // namespace snake_escape::controller
