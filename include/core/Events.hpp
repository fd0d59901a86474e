#pragma once

#include "Types.hpp"
#include "Move.hpp"
#include <string>
#include <variant>
#include <vector>

namespace snake_escape::core {

// ---------- Domain events ----------
// State deltas published to rendering/animation collaborators, in the
// order they happened.

struct EntityRelocated {
    EntityId entityId{};
    Cell from;
    Cell to;
};

struct EntityDestroyed {
    EntityId entityId{};
    Cell position;
};

struct SnakeMoved   { SnakeId snakeId{}; };
struct SnakeGrew    { SnakeId snakeId{}; };
struct SnakeSliced  { SnakeId snakeId{}; };
struct SnakeRemoved { SnakeId snakeId{}; };

struct FruitConsumed {
    Cell position;
};

struct FruitSpawned {
    EntityId entityId{};
    Cell position;
    std::vector<SnakeColor> colors;
};

struct ExitConsumed {
    Cell position;
};

struct HoleFilled {
    Cell holePosition;
    Cell fillerPosition; // where the filler was pushed from
};

struct PlateStateChanged {
    EntityId plateId{};
    bool active{};
};

struct LiftGateStateChanged {
    EntityId gateId{};
    bool open{};
};

struct LaserGateStateChanged {
    EntityId gateId{};
    bool active{};
};

struct PortalStateChanged {
    EntityId portalId{};
    bool active{};
};

struct LevelWon {};

// Reported for queued requests, whose result cannot be returned to the caller
struct MoveRejected {
    SnakeId snakeId{};
    MoveStatus reason{};
};

using DomainEvent = std::variant<
    EntityRelocated,
    EntityDestroyed,
    SnakeMoved,
    SnakeGrew,
    SnakeSliced,
    SnakeRemoved,
    FruitConsumed,
    FruitSpawned,
    ExitConsumed,
    HoleFilled,
    PlateStateChanged,
    LiftGateStateChanged,
    LaserGateStateChanged,
    PortalStateChanged,
    LevelWon,
    MoveRejected
>;

// Human-readable one-liner, for logs and the console view
std::string describe(const DomainEvent& event);

// Outbound queue filled by the simulation and drained by the session.
class EventBuffer {
public:
    void push(DomainEvent event) { events_.push_back(std::move(event)); }

    const std::vector<DomainEvent>& pending() const noexcept { return events_; }
    bool empty() const noexcept { return events_.empty(); }

    std::vector<DomainEvent> drain() {
        std::vector<DomainEvent> out;
        out.swap(events_);
        return out;
    }

    void clear() noexcept { events_.clear(); }

private:
    std::vector<DomainEvent> events_;
};

} // namespace snake_escape::core
