#pragma once

#include "Board.hpp"
#include "LevelData.hpp"
#include "LinkRegistry.hpp"
#include "Snake.hpp"
#include <optional>
#include <vector>

namespace snake_escape::core {

// Live state of one level: board, snakes and link registry.
// Owned by the session; resolver and refresher receive it explicitly.
class World {
public:
    // Builds the level from typed records. Throws std::invalid_argument on
    // inconsistent data (cells out of bounds, overlapping snakes, ...).
    explicit World(const LevelData& level);

    Board& board() noexcept { return board_; }
    const Board& board() const noexcept { return board_; }

    const LinkRegistry& links() const noexcept { return links_; }

    std::vector<Snake>& snakes() noexcept { return snakes_; }
    const std::vector<Snake>& snakes() const noexcept { return snakes_; }

    Snake* findSnake(SnakeId id) noexcept;
    const Snake* findSnake(SnakeId id) const noexcept;

    const Snake* snakeAt(Cell c) const noexcept;
    bool anySnakeAt(Cell c) const noexcept { return snakeAt(c) != nullptr; }

    void removeSnake(SnakeId id);

    // Something physical stands on c: a snake segment, a Box or an IceCube
    bool isOccupied(Cell c) const noexcept;

    // Can a pushed object move into c? In bounds, no snake, no
    // Wall/Box/IceCube/Fruit/Exit and no closed lift gate. `ignore` is the
    // object being moved, whose own cells never block it.
    bool isFreeForObject(Cell c, std::optional<EntityId> ignore = std::nullopt) const noexcept;

    // Portal destination test: no Wall/Box/IceCube/snake/closed lift gate.
    bool isPortalDestinationClear(Cell c) const noexcept;

    // If c holds an active, linked portal, the cell of its partner
    std::optional<Cell> portalExit(Cell c) const noexcept;

    // Throws std::invalid_argument if a snake, Box or IceCube stands in a
    // closed lift gate. Checked once gates have their initial state.
    void requireGatesClear() const;

private:
    Board board_;
    std::vector<Snake> snakes_;
    LinkRegistry links_;

    void populate(const LevelData& level);
    void requirePlaceable(const std::vector<Cell>& cells, const char* what) const;
};

} // namespace snake_escape::core
