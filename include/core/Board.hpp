#pragma once

#include "Types.hpp"
#include "Entity.hpp"
#include <limits>
#include <optional>
#include <vector>

namespace snake_escape::core {

// Grid of cell-entity sets plus the entity store they index into.
// Cells hold entity ids, never owning references; an entity covering
// several cells (Box, IceCube) is listed in each of them.
class Board {
public:
    // Id reported for every out-of-bounds cell; resolves to a Wall.
    static constexpr EntityId BoundaryWallId = std::numeric_limits<EntityId>::max();

    Board(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool inBounds(Cell c) const noexcept {
        return c.x >= 0 && c.x < width_ && c.y >= 0 && c.y < height_;
    }

    // Periodic boundary: maps any cell back onto the board
    Cell wrap(Cell c) const noexcept;

    // ---- Entity store ----

    // Create an entity and index it at its footprint. Throws std::out_of_range
    // if any footprint cell is outside the board.
    EntityId spawn(Cell position, EntityData data);

    // Remove the entity from every cell it is listed in and from the store.
    void destroy(EntityId id);

    // Move a Box/IceCube to a new footprint, keeping its id.
    void relocate(EntityId id, const std::vector<Cell>& footprint);

    bool exists(EntityId id) const noexcept;
    const Entity& entity(EntityId id) const;
    Entity& entity(EntityId id);

    // Live entity ids, in creation order
    std::vector<EntityId> ids() const;

    // ---- Cell index ----

    // Entities at a cell. Out-of-bounds cells report a single Wall.
    const std::vector<EntityId>& get(Cell c) const noexcept;

    void add(Cell c, EntityId id);
    void remove(Cell c, EntityId id);

    template <typename K>
    bool hasOfKind(Cell c) const noexcept {
        return firstIdOfKind<K>(c).has_value();
    }

    template <typename K>
    std::optional<EntityId> firstIdOfKind(Cell c) const noexcept {
        for (EntityId id : get(c)) {
            if (std::holds_alternative<K>(lookup(id).data)) {
                return id;
            }
        }
        return std::nullopt;
    }

    template <typename K>
    const K* firstOfKind(Cell c) const noexcept {
        auto id = firstIdOfKind<K>(c);
        return id ? std::get_if<K>(&lookup(*id).data) : nullptr;
    }

private:
    int width_;
    int height_;
    std::vector<std::vector<EntityId>> cells_; // width_ * height_
    std::vector<std::optional<Entity>> store_; // index == id

    std::size_t index(Cell c) const noexcept {
        return static_cast<std::size_t>(c.y) * static_cast<std::size_t>(width_)
             + static_cast<std::size_t>(c.x);
    }

    const Entity& lookup(EntityId id) const noexcept;
};

} // namespace snake_escape::core
