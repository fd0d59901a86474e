#pragma once

#include "Types.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace snake_escape::core {

// ---------- Entity kinds ----------
// Empty floor is not an entity: a cell with no entities behaves as floor.

struct Wall {};

struct Fruit {
    std::vector<SnakeColor> colors; // snake colors allowed to eat it
};

struct Exit {
    SnakeColor color{};
    int minLength{1};
};

struct Box {
    std::vector<Cell> cells; // footprint
};

struct IceCube {
    std::vector<Cell> cells; // footprint
};

struct Hole {};

struct PressurePlate {
    GroupColor color{};
    bool active{false};
};

struct LiftGate {
    GroupColor color{};
    bool open{false};
};

struct LaserGate {
    GroupColor color{};
    bool active{false};
};

struct Portal {
    PortalGroup group{};
    std::optional<EntityId> linked; // unset => unpaired, never active
    bool active{false};
};

using EntityData = std::variant<
    Wall,
    Fruit,
    Exit,
    Box,
    IceCube,
    Hole,
    PressurePlate,
    LiftGate,
    LaserGate,
    Portal
>;

struct Entity {
    EntityId id{};
    Cell position{}; // anchor cell; Box/IceCube keep their full footprint in data
    EntityData data;
};

// The snake end attempting to enter a cell
struct Mover {
    SnakeColor color{};
    SnakeEnd end{SnakeEnd::Head};
    std::size_t length{};
};

// Pure entry predicate for ordinary step-in (no push, no teleport).
// Box and IceCube always refuse here; the resolver handles them through the
// push/slide protocol. Portals never refuse here; the resolver checks their
// destination.
bool canEnter(const EntityData& data, const Mover& mover);

// Cells covered by the entity: the footprint for Box/IceCube, the anchor otherwise.
std::vector<Cell> footprintOf(const Entity& entity);

// True for kinds that are pushed rather than stepped on
bool isPushable(const EntityData& data) noexcept;

const char* kindName(const EntityData& data);

} // namespace snake_escape::core
