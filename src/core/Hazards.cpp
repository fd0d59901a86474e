#include "core/Hazards.hpp"

#include <algorithm>
#include <vector>

namespace snake_escape::core {

namespace {

bool activeLaserAt(const Board& board, Cell c) {
    const auto* laser = board.firstOfKind<LaserGate>(c);
    return laser != nullptr && laser->active;
}

} // namespace

bool settlePushable(World& world, EntityId id, Cell origin, EventBuffer& events) {
    Board& board = world.board();
    if (!board.exists(id)) {
        return false;
    }
    const Entity& object = board.entity(id);
    const auto footprint = footprintOf(object);
    const Cell position = object.position;

    const bool overHoles = std::all_of(footprint.begin(), footprint.end(),
                                       [&](Cell c) { return board.hasOfKind<Hole>(c); });
    if (overHoles) {
        for (const auto& c : footprint) {
            if (auto hole = board.firstIdOfKind<Hole>(c)) {
                board.destroy(*hole);
                events.push(HoleFilled{c, origin});
            }
        }
        board.destroy(id);
        events.push(EntityDestroyed{id, position});
        return true;
    }

    const bool overLasers = std::all_of(footprint.begin(), footprint.end(),
                                        [&](Cell c) { return activeLaserAt(board, c); });
    if (overLasers) {
        board.destroy(id);
        events.push(EntityDestroyed{id, position});
        return true;
    }
    return false;
}

bool sliceSnake(World& world, SnakeId id, Cell c, EventBuffer& events) {
    Snake* snake = world.findSnake(id);
    if (snake == nullptr || !snake->sliceAt(c)) {
        return false;
    }
    if (snake->empty()) {
        world.removeSnake(id);
        events.push(SnakeRemoved{id});
        return true;
    }
    events.push(SnakeSliced{id});
    return false;
}

bool strikeCell(World& world, Cell c, EventBuffer& events) {
    bool struck = false;

    std::vector<SnakeId> victims;
    for (const auto& s : world.snakes()) {
        if (s.occupies(c)) victims.push_back(s.id());
    }
    for (SnakeId id : victims) {
        sliceSnake(world, id, c, events);
        struck = true;
    }

    Board& board = world.board();
    const std::vector<EntityId> here = board.get(c);
    for (EntityId id : here) {
        if (!board.exists(id) || !isPushable(board.entity(id).data)) continue;
        const Cell position = board.entity(id).position;
        if (settlePushable(world, id, position, events)) {
            struck = true;
        }
    }
    return struck;
}

} // namespace snake_escape::core
