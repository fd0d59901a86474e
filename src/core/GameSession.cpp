#include "core/GameSession.hpp"

#include "core/StateRefresher.hpp"

#include <algorithm>
#include <stdexcept>

namespace snake_escape::core {

namespace {

// Marks the session as dispatching for the lifetime of the guard, so a
// listener that throws does not leave it stuck.
class DispatchGuard {
public:
    explicit DispatchGuard(bool& flag) : flag_{flag} { flag_ = true; }
    ~DispatchGuard() { flag_ = false; }

    DispatchGuard(const DispatchGuard&) = delete;
    DispatchGuard& operator=(const DispatchGuard&) = delete;

private:
    bool& flag_;
};

} // namespace

GameSession::GameSession(RuleConfig config)
    : config_{config}
{
}

void GameSession::loadLevel(const LevelData& level) {
    if (dispatching_) {
        throw std::logic_error("GameSession::loadLevel called during event dispatch");
    }
    // build first so a bad level leaves the current one untouched
    auto world = std::make_unique<World>(level);
    EventBuffer initial;
    StateRefresher{*world, initial}.refresh();
    world->requireGatesClear();

    level_ = level;
    world_ = std::move(world);
    resolver_ = std::make_unique<MovementResolver>(*world_, config_, events_);
    queued_.clear();
    events_.clear();
    status_ = LevelStatus::Running;

    for (auto& event : initial.drain()) {
        events_.push(std::move(event));
    }
    publish();
}

void GameSession::reloadLevel() {
    if (!level_) {
        return;
    }
    if (dispatching_) {
        reloadPending_ = true;
        return;
    }
    rebuild();
    publish();
}

void GameSession::rebuild() {
    world_ = std::make_unique<World>(*level_);
    resolver_ = std::make_unique<MovementResolver>(*world_, config_, events_);
    queued_.clear();
    events_.clear();
    status_ = LevelStatus::Running;
    StateRefresher{*world_, events_}.refresh();
}

MoveResult GameSession::requestMove(const MoveRequest& request) {
    if (dispatching_) {
        queued_.push_back(request);
        return MoveResult{MoveStatus::Queued};
    }
    const MoveResult result = runMove(request);
    publish();
    return result;
}

MoveResult GameSession::runMove(const MoveRequest& request) {
    if (!resolver_) {
        return MoveResult{MoveStatus::UnknownSnake};
    }

    const MoveResult result = resolver_->resolve(request, presentationBusy_);

    const auto& pending = events_.pending();
    const bool won = std::any_of(pending.begin(), pending.end(), [](const DomainEvent& e) {
        return std::holds_alternative<LevelWon>(e);
    });
    if (won) {
        status_ = LevelStatus::Won;
    }
    return result;
}

void GameSession::publish() {
    if (dispatching_) {
        return;
    }
    DispatchGuard guard{dispatching_};

    while (true) {
        for (const auto& event : events_.drain()) {
            const auto listeners = listeners_; // listeners may unregister themselves
            for (auto* listener : listeners) {
                listener->onEvent(event);
            }
        }

        if (!events_.empty()) {
            continue;
        }
        if (reloadPending_) {
            reloadPending_ = false;
            rebuild();
            continue;
        }
        if (queued_.empty()) {
            break;
        }

        const MoveRequest next = queued_.front();
        queued_.pop_front();
        const MoveResult result = runMove(next);
        if (!result.accepted()) {
            events_.push(MoveRejected{next.snakeId, result.status});
        }
    }
}

void GameSession::addListener(IEventListener& listener) {
    if (std::find(listeners_.begin(), listeners_.end(), &listener) == listeners_.end()) {
        listeners_.push_back(&listener);
    }
}

void GameSession::removeListener(IEventListener& listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), &listener),
                     listeners_.end());
}

ResolverState GameSession::resolverState() const noexcept {
    return resolver_ ? resolver_->state() : ResolverState::Idle;
}

const World& GameSession::world() const {
    if (!world_) {
        throw std::logic_error("GameSession::world no level loaded");
    }
    return *world_;
}

std::optional<SnakeEndRef> GameSession::snakeEndAt(Cell c) const {
    if (!world_) {
        return std::nullopt;
    }
    for (const auto& s : world_->snakes()) {
        if (s.head() == c) return SnakeEndRef{s.id(), SnakeEnd::Head};
        if (s.tail() == c) return SnakeEndRef{s.id(), SnakeEnd::Tail};
    }
    return std::nullopt;
}

} // namespace snake_escape::core
