#include "core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace snake_escape::core {

namespace {

const Entity& boundaryWall() {
    static const Entity wall{Board::BoundaryWallId, Cell{-1, -1}, Wall{}};
    return wall;
}

const std::vector<EntityId>& boundaryCell() {
    static const std::vector<EntityId> cell{Board::BoundaryWallId};
    return cell;
}

int wrapAxis(int v, int size) noexcept {
    int r = v % size;
    return r < 0 ? r + size : r;
}

} // namespace

Board::Board(int width, int height)
    : width_{width}
    , height_{height}
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    cells_.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
}

Cell Board::wrap(Cell c) const noexcept {
    return Cell{wrapAxis(c.x, width_), wrapAxis(c.y, height_)};
}

EntityId Board::spawn(Cell position, EntityData data) {
    Entity entity{static_cast<EntityId>(store_.size()), position, std::move(data)};

    const auto footprint = footprintOf(entity);
    if (footprint.empty()) {
        throw std::invalid_argument("Board::spawn entity with empty footprint");
    }
    for (const auto& c : footprint) {
        if (!inBounds(c)) {
            throw std::out_of_range("Board::spawn footprint out of range");
        }
    }
    entity.position = footprint.front();

    const EntityId id = entity.id;
    store_.emplace_back(std::move(entity));
    for (const auto& c : footprint) {
        cells_[index(c)].push_back(id);
    }
    return id;
}

void Board::destroy(EntityId id) {
    if (!exists(id)) {
        throw std::out_of_range("Board::destroy unknown entity");
    }
    for (const auto& c : footprintOf(*store_[id])) {
        remove(c, id);
    }
    store_[id].reset();
}

void Board::relocate(EntityId id, const std::vector<Cell>& footprint) {
    Entity& e = entity(id);
    if (footprint.empty()) {
        throw std::invalid_argument("Board::relocate empty footprint");
    }
    for (const auto& c : footprint) {
        if (!inBounds(c)) {
            throw std::out_of_range("Board::relocate footprint out of range");
        }
    }

    for (const auto& c : footprintOf(e)) {
        remove(c, id);
    }

    if (auto* box = std::get_if<Box>(&e.data)) {
        box->cells = footprint;
    } else if (auto* ice = std::get_if<IceCube>(&e.data)) {
        ice->cells = footprint;
    }
    e.position = footprint.front();

    for (const auto& c : footprintOf(e)) {
        add(c, id);
    }
}

bool Board::exists(EntityId id) const noexcept {
    return id < store_.size() && store_[id].has_value();
}

const Entity& Board::entity(EntityId id) const {
    if (id == BoundaryWallId) {
        return boundaryWall();
    }
    if (!exists(id)) {
        throw std::out_of_range("Board::entity unknown entity");
    }
    return *store_[id];
}

Entity& Board::entity(EntityId id) {
    if (!exists(id)) {
        throw std::out_of_range("Board::entity unknown entity");
    }
    return *store_[id];
}

std::vector<EntityId> Board::ids() const {
    std::vector<EntityId> out;
    for (const auto& e : store_) {
        if (e) out.push_back(e->id);
    }
    return out;
}

const std::vector<EntityId>& Board::get(Cell c) const noexcept {
    if (!inBounds(c)) {
        return boundaryCell();
    }
    return cells_[index(c)];
}

void Board::add(Cell c, EntityId id) {
    if (!inBounds(c)) {
        throw std::out_of_range("Board::add out of range");
    }
    if (!exists(id)) {
        throw std::out_of_range("Board::add unknown entity");
    }
    auto& cell = cells_[index(c)];
    if (std::find(cell.begin(), cell.end(), id) == cell.end()) {
        cell.push_back(id);
    }
}

void Board::remove(Cell c, EntityId id) {
    if (!inBounds(c)) {
        return;
    }
    auto& cell = cells_[index(c)];
    auto it = std::find(cell.begin(), cell.end(), id);
    if (it != cell.end()) {
        // order inside a cell carries no meaning
        *it = cell.back();
        cell.pop_back();
    }
}

const Entity& Board::lookup(EntityId id) const noexcept {
    if (id == BoundaryWallId || !exists(id)) {
        return boundaryWall();
    }
    return *store_[id];
}

} // namespace snake_escape::core
