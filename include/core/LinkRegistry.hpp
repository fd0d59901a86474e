#pragma once

#include "Types.hpp"
#include "Board.hpp"
#include <map>
#include <vector>

namespace snake_escape::core {

// Portal pairs and plate/gate color groups. Built once per level load.
class LinkRegistry {
public:
    LinkRegistry() = default;

    // Scans the board, links every portal group with exactly two endpoints
    // (writing Portal::linked on both) and groups plates and gates by color.
    // Groups with any other portal count stay unlinked and inert.
    static LinkRegistry build(Board& board);

    const std::vector<EntityId>& plates(GroupColor color) const;
    const std::vector<EntityId>& liftGates(GroupColor color) const;
    const std::vector<EntityId>& laserGates(GroupColor color) const;

    // Colors that have at least one plate or gate, ascending
    std::vector<GroupColor> groupColors() const;

    const std::vector<EntityId>& portals() const noexcept { return portals_; }

private:
    std::map<GroupColor, std::vector<EntityId>> plates_;
    std::map<GroupColor, std::vector<EntityId>> liftGates_;
    std::map<GroupColor, std::vector<EntityId>> laserGates_;

    std::vector<EntityId> portals_;
};

} // namespace snake_escape::core
