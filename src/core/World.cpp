#include "core/World.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace snake_escape::core {

namespace {

void requireInside(const Board& board, Cell c, const char* what) {
    if (!board.inBounds(c)) {
        throw std::invalid_argument(std::string{"Level data: "} + what + " at ("
                                    + std::to_string(c.x) + "," + std::to_string(c.y)
                                    + ") is outside the board");
    }
}

void requireFootprint(const Board& board, const std::vector<Cell>& cells, const char* what) {
    if (cells.empty()) {
        throw std::invalid_argument(std::string{"Level data: "} + what + " without cells");
    }
    for (const auto& c : cells) {
        requireInside(board, c, what);
    }
}

} // namespace

World::World(const LevelData& level)
    : board_{level.width, level.height}
{
    populate(level);
    links_ = LinkRegistry::build(board_);
}

void World::populate(const LevelData& level) {
    for (const auto& c : level.walls) {
        requireInside(board_, c, "wall");
        board_.spawn(c, Wall{});
    }
    for (const auto& exit : level.exits) {
        requireInside(board_, exit.position, "exit");
        board_.spawn(exit.position, Exit{exit.color, exit.minLength});
    }
    for (const auto& fruit : level.fruits) {
        requireInside(board_, fruit.position, "fruit");
        board_.spawn(fruit.position, Fruit{fruit.colors});
    }

    SnakeId nextId = 0;
    for (const auto& spec : level.snakes) {
        if (spec.body.empty()) {
            throw std::invalid_argument("Level data: snake without body");
        }
        for (const auto& c : spec.body) {
            requireInside(board_, c, "snake segment");
            if (anySnakeAt(c)) {
                throw std::invalid_argument("Level data: snakes overlap");
            }
            if (board_.hasOfKind<Wall>(c)) {
                throw std::invalid_argument("Level data: snake segment on a wall");
            }
        }
        snakes_.emplace_back(nextId++, spec.color, spec.body);
    }

    for (const auto& cells : level.boxes) {
        requirePlaceable(cells, "box");
        board_.spawn(cells.front(), Box{cells});
    }
    for (const auto& cells : level.iceCubes) {
        requirePlaceable(cells, "ice cube");
        board_.spawn(cells.front(), IceCube{cells});
    }
    for (const auto& c : level.holes) {
        requireInside(board_, c, "hole");
        if (anySnakeAt(c)) {
            throw std::invalid_argument("Level data: snake segment on a hole");
        }
        board_.spawn(c, Hole{});
    }
    for (const auto& plate : level.plates) {
        requireInside(board_, plate.position, "pressure plate");
        board_.spawn(plate.position, PressurePlate{plate.color, false});
    }
    for (const auto& gate : level.liftGates) {
        requireInside(board_, gate.position, "lift gate");
        board_.spawn(gate.position, LiftGate{gate.color, false});
    }
    for (const auto& laser : level.laserGates) {
        requireInside(board_, laser.position, "laser gate");
        board_.spawn(laser.position, LaserGate{laser.color, false});
    }
    for (const auto& portal : level.portals) {
        requireInside(board_, portal.position, "portal");
        board_.spawn(portal.position, Portal{portal.group, std::nullopt, false});
    }
}

void World::requirePlaceable(const std::vector<Cell>& cells, const char* what) const {
    requireFootprint(board_, cells, what);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (std::find(cells.begin(), cells.begin() + i, cells[i]) != cells.begin() + i) {
            throw std::invalid_argument(std::string{"Level data: "} + what + " repeats a cell");
        }
        // same rule as a pushed object arriving there
        if (!isFreeForObject(cells[i])) {
            throw std::invalid_argument(std::string{"Level data: "} + what + " at ("
                                        + std::to_string(cells[i].x) + ","
                                        + std::to_string(cells[i].y) + ") overlaps another object");
        }
    }
}

void World::requireGatesClear() const {
    for (GroupColor color : links_.groupColors()) {
        for (EntityId id : links_.liftGates(color)) {
            if (!board_.exists(id)) continue;
            const Entity& e = board_.entity(id);
            if (!std::get<LiftGate>(e.data).open && isOccupied(e.position)) {
                throw std::invalid_argument("Level data: closed lift gate at ("
                                            + std::to_string(e.position.x) + ","
                                            + std::to_string(e.position.y) + ") is occupied");
            }
        }
    }
}

Snake* World::findSnake(SnakeId id) noexcept {
    auto it = std::find_if(snakes_.begin(), snakes_.end(),
                           [id](const Snake& s) { return s.id() == id; });
    return it == snakes_.end() ? nullptr : &*it;
}

const Snake* World::findSnake(SnakeId id) const noexcept {
    auto it = std::find_if(snakes_.begin(), snakes_.end(),
                           [id](const Snake& s) { return s.id() == id; });
    return it == snakes_.end() ? nullptr : &*it;
}

const Snake* World::snakeAt(Cell c) const noexcept {
    for (const auto& s : snakes_) {
        if (s.occupies(c)) return &s;
    }
    return nullptr;
}

void World::removeSnake(SnakeId id) {
    snakes_.erase(std::remove_if(snakes_.begin(), snakes_.end(),
                                 [id](const Snake& s) { return s.id() == id; }),
                  snakes_.end());
}

bool World::isOccupied(Cell c) const noexcept {
    return anySnakeAt(c) || board_.hasOfKind<Box>(c) || board_.hasOfKind<IceCube>(c);
}

bool World::isFreeForObject(Cell c, std::optional<EntityId> ignore) const noexcept {
    if (!board_.inBounds(c) || anySnakeAt(c)) {
        return false;
    }
    for (EntityId id : board_.get(c)) {
        if (ignore && id == *ignore) continue;

        const auto& data = board_.entity(id).data;
        if (std::holds_alternative<Wall>(data) || std::holds_alternative<Box>(data)
            || std::holds_alternative<IceCube>(data) || std::holds_alternative<Fruit>(data)
            || std::holds_alternative<Exit>(data)) {
            return false;
        }
        if (const auto* gate = std::get_if<LiftGate>(&data); gate && !gate->open) {
            return false;
        }
    }
    return true;
}

bool World::isPortalDestinationClear(Cell c) const noexcept {
    if (anySnakeAt(c)) {
        return false;
    }
    if (board_.hasOfKind<Wall>(c) || board_.hasOfKind<Box>(c) || board_.hasOfKind<IceCube>(c)) {
        return false;
    }
    const auto* gate = board_.firstOfKind<LiftGate>(c);
    return gate == nullptr || gate->open;
}

std::optional<Cell> World::portalExit(Cell c) const noexcept {
    const auto* portal = board_.firstOfKind<Portal>(c);
    if (portal == nullptr || !portal->active || !portal->linked) {
        return std::nullopt;
    }
    if (!board_.exists(*portal->linked)) {
        return std::nullopt;
    }
    return board_.entity(*portal->linked).position;
}

} // namespace snake_escape::core
