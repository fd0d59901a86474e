#pragma once

#include "Events.hpp"
#include "Move.hpp"
#include "RuleConfig.hpp"
#include "World.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace snake_escape::core {

enum class ResolverState : std::uint8_t {
    Idle,
    ValidatingMove,
    Rejected,
    Executing
};

// Decides whether a move request is legal and, if so, executes it together
// with its cascades: push or slide of the object in front, portal hops,
// fruit, exits, lasers, holes, then a full state refresh.
//
// Validation completes before the first mutation, so a rejected request
// leaves the world exactly as it was.
class MovementResolver {
public:
    MovementResolver(World& world, const RuleConfig& config, EventBuffer& events);

    MoveResult resolve(const MoveRequest& request, bool presentationBusy);

    // Would a head at `from` entering `target` push the Box there?
    bool canPushBox(const Snake& mover, Cell from, Cell target) const;

    // Would a head at `from` entering `target` slide the IceCube there?
    bool canSlideIceCube(const Snake& mover, Cell from, Cell target) const;

    ResolverState state() const noexcept { return state_; }

private:
    struct ObjectMove {
        EntityId id{};
        std::vector<Cell> footprint; // where the object comes to rest
    };

    struct Plan {
        Cell direction;
        Cell target;       // cell the moving end steps into
        Cell finalCell;    // target, or the partner cell after a portal hop
        bool teleport{false};
        std::optional<ObjectMove> push;
    };

    World& world_;
    const RuleConfig& config_;
    EventBuffer& events_;
    ResolverState state_{ResolverState::Idle};

    MoveResult finish(MoveStatus status);

    MoveStatus validate(const Snake& snake, const MoveRequest& request, Plan& plan) const;
    MoveStatus checkEntry(const Snake& snake, SnakeEnd end, Cell cell,
                          bool mayPush, Plan& plan) const;

    // Unit step from `from` to `to`, toroidal for the wrapping color;
    // nullopt when the cells are not one step apart.
    std::optional<Cell> stepDirection(const Snake& snake, Cell from, Cell to) const;

    // Landing footprint of the object, or nullopt if blocked. `entry` is the
    // cell the moving end steps into; the object may never rest there.
    std::optional<std::vector<Cell>> planPush(EntityId box, Cell direction, Cell entry) const;
    std::optional<std::vector<Cell>> planSlide(EntityId cube, Cell direction, Cell entry) const;

    void execute(SnakeId id, SnakeEnd end, const Plan& plan);
    void moveObject(const ObjectMove& move);
    bool wouldEat(const Snake& snake, SnakeEnd end, Cell cell) const;

    // Fires the entry effects of everything at `cell`. Returns true if the
    // snake left play (exit or fully sliced).
    bool enterCell(SnakeId id, SnakeEnd end, Cell cell);
    void takeExit(SnakeId id, EntityId exit);
};

} // namespace snake_escape::core
