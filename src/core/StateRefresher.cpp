#include "core/StateRefresher.hpp"

#include "core/Hazards.hpp"

#include <algorithm>

namespace snake_escape::core {

namespace {

// A laser strike changes occupancy, which can release a plate and arm more
// lasers. Each round destroys at least one thing, so this is never reached
// on real levels.
constexpr int MaxStrikeRounds = 16;

} // namespace

StateRefresher::StateRefresher(World& world, EventBuffer& events)
    : world_{world}
    , events_{events}
{
}

void StateRefresher::refresh() {
    for (int round = 0; round < MaxStrikeRounds; ++round) {
        platePass();
        if (!gatePass()) {
            break;
        }
    }
    portalPass();
}

void StateRefresher::platePass() {
    Board& board = world_.board();
    const auto& links = world_.links();

    for (GroupColor color : links.groupColors()) {
        for (EntityId id : links.plates(color)) {
            if (!board.exists(id)) continue;
            Entity& e = board.entity(id);
            auto& plate = std::get<PressurePlate>(e.data);

            const bool occupied = world_.isOccupied(e.position);
            if (plate.active != occupied) {
                plate.active = occupied;
                events_.push(PlateStateChanged{id, occupied});
            }
        }
    }
}

bool StateRefresher::gatePass() {
    Board& board = world_.board();
    const auto& links = world_.links();
    bool struck = false;

    for (GroupColor color : links.groupColors()) {
        const auto& plates = links.plates(color);
        if (plates.empty()) {
            // no sensor drives this group; gates keep their initial state
            continue;
        }

        const bool allActive = std::all_of(plates.begin(), plates.end(), [&](EntityId id) {
            return board.exists(id) && std::get<PressurePlate>(board.entity(id).data).active;
        });

        for (EntityId id : links.liftGates(color)) {
            if (!board.exists(id)) continue;
            Entity& e = board.entity(id);
            auto& gate = std::get<LiftGate>(e.data);

            if (allActive) {
                if (!gate.open) {
                    gate.open = true;
                    events_.push(LiftGateStateChanged{id, true});
                }
            } else if (gate.open && !world_.isOccupied(e.position)) {
                gate.open = false;
                events_.push(LiftGateStateChanged{id, false});
            }
        }

        for (EntityId id : links.laserGates(color)) {
            if (!board.exists(id)) continue;
            Entity& e = board.entity(id);
            auto& laser = std::get<LaserGate>(e.data);

            const bool shouldBeActive = !allActive;
            if (laser.active == shouldBeActive) continue;

            laser.active = shouldBeActive;
            const Cell position = e.position;
            events_.push(LaserGateStateChanged{id, shouldBeActive});
            if (shouldBeActive && strikeCell(world_, position, events_)) {
                struck = true;
            }
        }
    }
    return struck;
}

void StateRefresher::portalPass() {
    Board& board = world_.board();

    for (EntityId id : world_.links().portals()) {
        if (!board.exists(id)) continue;
        auto& portal = std::get<Portal>(board.entity(id).data);

        bool active = false;
        if (portal.linked && board.exists(*portal.linked)) {
            active = world_.isPortalDestinationClear(board.entity(*portal.linked).position);
        }
        if (portal.active != active) {
            portal.active = active;
            events_.push(PortalStateChanged{id, active});
        }
    }
}

} // namespace snake_escape::core
