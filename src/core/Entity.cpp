#include "core/Entity.hpp"

#include <algorithm>

namespace snake_escape::core {

namespace {

// One overload per kind and no generic fallback: adding a kind to
// EntityData without a rule here fails to compile.
struct EntryRule {
    const Mover& mover;

    bool operator()(const Wall&) const { return false; }
    bool operator()(const LiftGate& gate) const { return gate.open; }
    bool operator()(const Box&) const { return false; }
    bool operator()(const IceCube&) const { return false; }
    bool operator()(const Hole&) const { return false; }
    bool operator()(const LaserGate&) const { return true; }

    bool operator()(const Fruit& fruit) const {
        if (mover.end == SnakeEnd::Tail) return false;
        return std::find(fruit.colors.begin(), fruit.colors.end(), mover.color) != fruit.colors.end();
    }

    bool operator()(const Exit& exit) const {
        if (mover.end == SnakeEnd::Tail) return false;
        return mover.color == exit.color
            && mover.length >= static_cast<std::size_t>(exit.minLength);
    }

    bool operator()(const Portal&) const { return true; }
    bool operator()(const PressurePlate&) const { return true; }
};

struct KindName {
    const char* operator()(const Wall&) const { return "Wall"; }
    const char* operator()(const Fruit&) const { return "Fruit"; }
    const char* operator()(const Exit&) const { return "Exit"; }
    const char* operator()(const Box&) const { return "Box"; }
    const char* operator()(const IceCube&) const { return "IceCube"; }
    const char* operator()(const Hole&) const { return "Hole"; }
    const char* operator()(const PressurePlate&) const { return "PressurePlate"; }
    const char* operator()(const LiftGate&) const { return "LiftGate"; }
    const char* operator()(const LaserGate&) const { return "LaserGate"; }
    const char* operator()(const Portal&) const { return "Portal"; }
};

} // namespace

bool canEnter(const EntityData& data, const Mover& mover) {
    return std::visit(EntryRule{mover}, data);
}

std::vector<Cell> footprintOf(const Entity& entity) {
    if (const auto* box = std::get_if<Box>(&entity.data)) {
        return box->cells;
    }
    if (const auto* ice = std::get_if<IceCube>(&entity.data)) {
        return ice->cells;
    }
    return {entity.position};
}

bool isPushable(const EntityData& data) noexcept {
    return std::holds_alternative<Box>(data) || std::holds_alternative<IceCube>(data);
}

const char* kindName(const EntityData& data) {
    return std::visit(KindName{}, data);
}

} // namespace snake_escape::core
