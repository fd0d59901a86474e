#include "core/MovementResolver.hpp"

#include "core/Hazards.hpp"
#include "core/StateRefresher.hpp"

#include <algorithm>
#include <cassert>

namespace snake_escape::core {

namespace {

// Signed unit offset from a to b on a ring of `size` cells, if b is at most
// one step away.
std::optional<int> ringStep(int a, int b, int size) {
    const int d = ((b - a) % size + size) % size;
    if (d == 0) return 0;
    if (d == 1) return 1;
    if (d == size - 1) return -1;
    return std::nullopt;
}

bool contains(const std::vector<Cell>& cells, Cell c) {
    return std::find(cells.begin(), cells.end(), c) != cells.end();
}

enum class EntryEffect {
    None,
    ConsumeFruit,
    TakeExit,
    Slice
};

// What happens to a snake end that comes to rest on each kind.
struct EntryEffectOf {
    EntryEffect operator()(const Wall&) const { return EntryEffect::None; }
    EntryEffect operator()(const Fruit&) const { return EntryEffect::ConsumeFruit; }
    EntryEffect operator()(const Exit&) const { return EntryEffect::TakeExit; }
    EntryEffect operator()(const Box&) const { return EntryEffect::None; }
    EntryEffect operator()(const IceCube&) const { return EntryEffect::None; }
    EntryEffect operator()(const Hole&) const { return EntryEffect::None; }
    EntryEffect operator()(const PressurePlate&) const { return EntryEffect::None; }
    EntryEffect operator()(const LiftGate&) const { return EntryEffect::None; }
    EntryEffect operator()(const LaserGate& laser) const {
        return laser.active ? EntryEffect::Slice : EntryEffect::None;
    }
    EntryEffect operator()(const Portal&) const { return EntryEffect::None; }
};

} // namespace

MovementResolver::MovementResolver(World& world, const RuleConfig& config, EventBuffer& events)
    : world_{world}
    , config_{config}
    , events_{events}
{
}

MoveResult MovementResolver::resolve(const MoveRequest& request, bool presentationBusy) {
    state_ = ResolverState::ValidatingMove;

    if (presentationBusy) {
        return finish(MoveStatus::AnimationInProgress);
    }

    const Snake* snake = world_.findSnake(request.snakeId);
    if (snake == nullptr) {
        return finish(MoveStatus::UnknownSnake);
    }
    assert(!snake->empty());

    Plan plan;
    const MoveStatus status = validate(*snake, request, plan);
    if (status != MoveStatus::Ok) {
        return finish(status);
    }

    state_ = ResolverState::Executing;
    execute(request.snakeId, request.end, plan);
    return finish(MoveStatus::Ok);
}

MoveResult MovementResolver::finish(MoveStatus status) {
    state_ = (status == MoveStatus::Ok) ? ResolverState::Idle : ResolverState::Rejected;
    return MoveResult{status};
}

// ---------- Validation ----------

MoveStatus MovementResolver::validate(const Snake& snake, const MoveRequest& request, Plan& plan) const {
    if (request.end == SnakeEnd::Tail && snake.color() != config_.reversibleColor) {
        return MoveStatus::IllegalEnd;
    }

    const Cell from = snake.end(request.end);
    Cell target = request.target;
    if (snake.color() == config_.wrappingColor) {
        target = world_.board().wrap(target);
    }

    const auto direction = stepDirection(snake, from, target);
    if (!direction) {
        return MoveStatus::NotAdjacent;
    }
    plan.direction = *direction;
    plan.target = target;
    plan.finalCell = target;

    MoveStatus status = checkEntry(snake, request.end, target, /*mayPush=*/true, plan);
    if (status != MoveStatus::Ok) {
        return status;
    }

    if (world_.board().hasOfKind<Portal>(target)) {
        const auto exit = world_.portalExit(target);
        if (!exit) {
            return MoveStatus::Obstructed; // inactive or unpaired portal
        }
        status = checkEntry(snake, request.end, *exit, /*mayPush=*/false, plan);
        if (status != MoveStatus::Ok) {
            return status;
        }
        plan.teleport = true;
        plan.finalCell = *exit;
    }
    return MoveStatus::Ok;
}

MoveStatus MovementResolver::checkEntry(const Snake& snake, SnakeEnd end, Cell cell,
                                        bool mayPush, Plan& plan) const {
    const Board& board = world_.board();

    for (const auto& other : world_.snakes()) {
        if (!other.occupies(cell)) continue;
        // a reversing snake may crawl into the cell its head is leaving
        const bool ownHead = other.id() == snake.id() && end == SnakeEnd::Tail && cell == snake.head();
        if (!ownHead) {
            return MoveStatus::Obstructed;
        }
    }

    if (board.hasOfKind<Wall>(cell)) {
        return MoveStatus::Obstructed;
    }
    if (const auto* gate = board.firstOfKind<LiftGate>(cell); gate && !gate->open) {
        return MoveStatus::Obstructed;
    }

    const auto box = board.firstIdOfKind<Box>(cell);
    const auto cube = board.firstIdOfKind<IceCube>(cell);
    if (box || cube) {
        if (!mayPush || end == SnakeEnd::Tail) {
            return MoveStatus::Obstructed;
        }
        auto footprint = box ? planPush(*box, plan.direction, cell)
                              : planSlide(*cube, plan.direction, cell);
        if (!footprint) {
            return MoveStatus::Obstructed;
        }
        plan.push = ObjectMove{box ? *box : *cube, std::move(*footprint)};
    }

    if (board.hasOfKind<Hole>(cell)) {
        return MoveStatus::Obstructed;
    }

    const Mover mover{snake.color(), end, snake.length()};
    for (EntityId id : board.get(cell)) {
        const auto& data = board.entity(id).data;
        if (isPushable(data)) continue; // handled by the push above
        if (!canEnter(data, mover)) {
            return MoveStatus::InteractionDenied;
        }
    }
    return MoveStatus::Ok;
}

std::optional<Cell> MovementResolver::stepDirection(const Snake& snake, Cell from, Cell to) const {
    if (snake.color() != config_.wrappingColor) {
        if (manhattan(from, to) != 1) return std::nullopt;
        return to - from;
    }

    const Board& board = world_.board();
    const auto dx = ringStep(from.x, to.x, board.width());
    const auto dy = ringStep(from.y, to.y, board.height());
    if (!dx || !dy || std::abs(*dx) + std::abs(*dy) != 1) {
        return std::nullopt;
    }
    return Cell{*dx, *dy};
}

// ---------- Push / slide ----------

bool MovementResolver::canPushBox(const Snake& mover, Cell from, Cell target) const {
    const auto box = world_.board().firstIdOfKind<Box>(target);
    const auto direction = stepDirection(mover, from, target);
    return box && direction && planPush(*box, *direction, target).has_value();
}

bool MovementResolver::canSlideIceCube(const Snake& mover, Cell from, Cell target) const {
    const auto cube = world_.board().firstIdOfKind<IceCube>(target);
    const auto direction = stepDirection(mover, from, target);
    return cube && direction && planSlide(*cube, *direction, target).has_value();
}

std::optional<std::vector<Cell>> MovementResolver::planPush(EntityId box, Cell direction,
                                                            Cell entry) const {
    const auto current = footprintOf(world_.board().entity(box));

    std::vector<Cell> landing;
    landing.reserve(current.size());
    for (const auto& c : current) {
        landing.push_back(c + direction);
    }

    // One portal hop for the whole box: the first shifted cell standing on
    // an active portal carries every cell along by the same offset.
    for (const auto& c : landing) {
        if (const auto exit = world_.portalExit(c)) {
            const Cell offset = *exit - c;
            for (auto& l : landing) {
                l = l + offset;
            }
            break;
        }
    }

    for (const auto& c : landing) {
        // after a hop the box may fold back onto the cell the mover enters
        if (c == entry) {
            return std::nullopt;
        }
        if (contains(current, c)) continue;
        if (!world_.isFreeForObject(c, box)) {
            return std::nullopt;
        }
    }
    return landing;
}

std::optional<std::vector<Cell>> MovementResolver::planSlide(EntityId cube, Cell direction,
                                                             Cell entry) const {
    const Board& board = world_.board();
    std::vector<Cell> shape = footprintOf(board.entity(cube));
    int steps = 0;

    while (steps < config_.maxSlideSteps) {
        std::vector<Cell> next;
        next.reserve(shape.size());
        bool blocked = false;

        for (const auto& c : shape) {
            Cell t = c + direction;
            // portals keep the momentum: continue from the partner cell
            if (const auto exit = world_.portalExit(t)) {
                t = *exit;
            }
            if (t == entry || (!contains(shape, t) && !world_.isFreeForObject(t, cube))) {
                blocked = true;
                break;
            }
            next.push_back(t);
        }
        if (blocked) {
            break;
        }

        shape = std::move(next);
        ++steps;

        const bool overHoles = std::all_of(shape.begin(), shape.end(),
                                           [&](Cell c) { return board.hasOfKind<Hole>(c); });
        if (overHoles) {
            break;
        }
    }

    if (steps == 0) {
        return std::nullopt;
    }
    return shape;
}

// ---------- Execution ----------

void MovementResolver::execute(SnakeId id, SnakeEnd end, const Plan& plan) {
    if (plan.push) {
        moveObject(*plan.push);
    }

    Snake* snake = world_.findSnake(id);
    assert(snake != nullptr);

    // the pushed object may have settled on the partner cell
    const bool teleport = plan.teleport && world_.isPortalDestinationClear(plan.finalCell);
    const Cell finalCell = teleport ? plan.finalCell : plan.target;
    const bool grows = wouldEat(*snake, end, finalCell);

    if (end == SnakeEnd::Head) {
        snake->advanceHead(plan.target, grows);
    } else {
        snake->advanceTail(plan.target);
    }
    if (teleport) {
        snake->setEnd(end, finalCell);
    }

    const bool leftPlay = enterCell(id, end, finalCell);
    if (!leftPlay && world_.findSnake(id) != nullptr) {
        if (grows) {
            events_.push(SnakeGrew{id});
        } else {
            events_.push(SnakeMoved{id});
        }
    }

    StateRefresher{world_, events_}.refresh();
}

void MovementResolver::moveObject(const ObjectMove& move) {
    Board& board = world_.board();
    const Cell origin = board.entity(move.id).position;

    board.relocate(move.id, move.footprint);
    events_.push(EntityRelocated{move.id, origin, board.entity(move.id).position});

    settlePushable(world_, move.id, origin, events_);
}

bool MovementResolver::wouldEat(const Snake& snake, SnakeEnd end, Cell cell) const {
    if (end != SnakeEnd::Head) {
        return false;
    }
    const auto* fruit = world_.board().firstOfKind<Fruit>(cell);
    return fruit != nullptr && canEnter(*fruit, Mover{snake.color(), end, snake.length()});
}

bool MovementResolver::enterCell(SnakeId id, SnakeEnd end, Cell cell) {
    Board& board = world_.board();
    const std::vector<EntityId> here = board.get(cell);

    for (EntityId entityId : here) {
        if (!board.exists(entityId)) continue;
        const Snake* snake = world_.findSnake(id);
        if (snake == nullptr) {
            return true;
        }

        const Entity& entity = board.entity(entityId);
        const Mover mover{snake->color(), end, snake->length()};

        switch (std::visit(EntryEffectOf{}, entity.data)) {
        case EntryEffect::None:
            break;
        case EntryEffect::ConsumeFruit:
            // growth was applied with the body update
            if (canEnter(entity.data, mover)) {
                board.destroy(entityId);
                events_.push(FruitConsumed{cell});
            }
            break;
        case EntryEffect::TakeExit:
            if (canEnter(entity.data, mover)) {
                takeExit(id, entityId);
                return true;
            }
            break;
        case EntryEffect::Slice:
            if (sliceSnake(world_, id, cell, events_)) {
                return true;
            }
            break;
        }
    }
    return false;
}

void MovementResolver::takeExit(SnakeId id, EntityId exit) {
    Board& board = world_.board();
    const Cell position = board.entity(exit).position;

    board.destroy(exit);
    events_.push(ExitConsumed{position});

    world_.removeSnake(id);
    events_.push(SnakeRemoved{id});

    if (config_.respawnFruitOnExit) {
        std::vector<SnakeColor> colors;
        for (const auto& s : world_.snakes()) {
            if (std::find(colors.begin(), colors.end(), s.color()) == colors.end()) {
                colors.push_back(s.color());
            }
        }
        if (!colors.empty()) {
            const EntityId fruit = board.spawn(position, Fruit{colors});
            events_.push(FruitSpawned{fruit, position, colors});
        }
    }

    if (world_.snakes().empty()) {
        events_.push(LevelWon{});
    }
}

} // namespace snake_escape::core
