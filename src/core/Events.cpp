#include "core/Events.hpp"

#include <sstream>

namespace snake_escape::core {

namespace {

std::ostream& operator<<(std::ostream& os, Cell c) {
    return os << '(' << c.x << ',' << c.y << ')';
}

const char* onOff(bool v) { return v ? "on" : "off"; }

struct Describe {
    std::ostringstream& os;

    void operator()(const EntityRelocated& e) const {
        os << "EntityRelocated #" << e.entityId << ' ' << e.from << " -> " << e.to;
    }
    void operator()(const EntityDestroyed& e) const {
        os << "EntityDestroyed #" << e.entityId << " at " << e.position;
    }
    void operator()(const SnakeMoved& e) const { os << "SnakeMoved " << e.snakeId; }
    void operator()(const SnakeGrew& e) const { os << "SnakeGrew " << e.snakeId; }
    void operator()(const SnakeSliced& e) const { os << "SnakeSliced " << e.snakeId; }
    void operator()(const SnakeRemoved& e) const { os << "SnakeRemoved " << e.snakeId; }
    void operator()(const FruitConsumed& e) const { os << "FruitConsumed at " << e.position; }

    void operator()(const FruitSpawned& e) const {
        os << "FruitSpawned #" << e.entityId << " at " << e.position << " for";
        for (auto color : e.colors) {
            os << ' ' << toString(color);
        }
    }

    void operator()(const ExitConsumed& e) const { os << "ExitConsumed at " << e.position; }
    void operator()(const HoleFilled& e) const {
        os << "HoleFilled at " << e.holePosition << " by object from " << e.fillerPosition;
    }
    void operator()(const PlateStateChanged& e) const {
        os << "PlateStateChanged #" << e.plateId << ' ' << onOff(e.active);
    }
    void operator()(const LiftGateStateChanged& e) const {
        os << "LiftGateStateChanged #" << e.gateId << ' ' << (e.open ? "open" : "closed");
    }
    void operator()(const LaserGateStateChanged& e) const {
        os << "LaserGateStateChanged #" << e.gateId << ' ' << onOff(e.active);
    }
    void operator()(const PortalStateChanged& e) const {
        os << "PortalStateChanged #" << e.portalId << ' ' << onOff(e.active);
    }
    void operator()(const LevelWon&) const { os << "LevelWon"; }
    void operator()(const MoveRejected& e) const {
        os << "MoveRejected snake " << e.snakeId << ": " << toString(e.reason);
    }
};

} // namespace

std::string describe(const DomainEvent& event) {
    std::ostringstream os;
    std::visit(Describe{os}, event);
    return os.str();
}

} // namespace snake_escape::core
