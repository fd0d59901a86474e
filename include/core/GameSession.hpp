#pragma once

#include "Events.hpp"
#include "IEventListener.hpp"
#include "LevelData.hpp"
#include "Move.hpp"
#include "MovementResolver.hpp"
#include "RuleConfig.hpp"
#include "World.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace snake_escape::core {

enum class LevelStatus {
    NotLoaded,
    Running,
    Won
};

struct SnakeEndRef {
    SnakeId snakeId{};
    SnakeEnd end{SnakeEnd::Head};
};

/// Session orchestrator:
/// - owns the live world of the current level
/// - runs move requests through the MovementResolver, one at a time
/// - drains the event buffer and republishes events to listeners in order
/// Requests made from inside a listener are queued and run after the
/// current dispatch; their rejections arrive as MoveRejected events.
class GameSession {
public:
    explicit GameSession(RuleConfig config = {});

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /// Builds the level and runs the initial refresh. Throws
    /// std::invalid_argument on bad level data, std::logic_error when
    /// called from inside a listener.
    void loadLevel(const LevelData& level);

    /// Rebuilds the last loaded level. Deferred when called from a listener.
    void reloadLevel();

    MoveResult requestMove(const MoveRequest& request);

    /// Advisory flag from the presentation layer (animation in flight).
    void setPresentationBusy(bool busy) noexcept { presentationBusy_ = busy; }
    bool presentationBusy() const noexcept { return presentationBusy_; }

    /// Listeners are not owned; callers keep them alive while registered.
    void addListener(IEventListener& listener);
    void removeListener(IEventListener& listener);

    LevelStatus status() const noexcept { return status_; }
    bool hasLevel() const noexcept { return world_ != nullptr; }

    /// Throws std::logic_error when no level is loaded.
    const World& world() const;

    const RuleConfig& config() const noexcept { return config_; }

    /// Where the last request left the movement resolver; Idle before any.
    ResolverState resolverState() const noexcept;

    /// Which snake end sits at c, heads first.
    std::optional<SnakeEndRef> snakeEndAt(Cell c) const;

private:
    RuleConfig config_;
    std::optional<LevelData> level_;
    std::unique_ptr<World> world_;
    std::unique_ptr<MovementResolver> resolver_; // bound to *world_
    EventBuffer events_;
    std::vector<IEventListener*> listeners_;

    LevelStatus status_{LevelStatus::NotLoaded};
    bool presentationBusy_{false};

    bool dispatching_{false};
    bool reloadPending_{false};
    std::deque<MoveRequest> queued_;

    void rebuild();
    MoveResult runMove(const MoveRequest& request);
    void publish();
};

} // namespace snake_escape::core
