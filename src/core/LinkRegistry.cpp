#include "core/LinkRegistry.hpp"

#include <iostream>
#include <set>

namespace snake_escape::core {

namespace {

const std::vector<EntityId>& groupOf(const std::map<GroupColor, std::vector<EntityId>>& groups,
                                     GroupColor color) {
    static const std::vector<EntityId> none;
    auto it = groups.find(color);
    return it == groups.end() ? none : it->second;
}

} // namespace

LinkRegistry LinkRegistry::build(Board& board) {
    LinkRegistry reg;
    std::map<PortalGroup, std::vector<EntityId>> portalGroups;

    for (EntityId id : board.ids()) {
        Entity& e = board.entity(id);
        if (const auto* plate = std::get_if<PressurePlate>(&e.data)) {
            reg.plates_[plate->color].push_back(id);
        } else if (const auto* gate = std::get_if<LiftGate>(&e.data)) {
            reg.liftGates_[gate->color].push_back(id);
        } else if (const auto* laser = std::get_if<LaserGate>(&e.data)) {
            reg.laserGates_[laser->color].push_back(id);
        } else if (auto* portal = std::get_if<Portal>(&e.data)) {
            portal->linked.reset();
            portal->active = false;
            reg.portals_.push_back(id);
            portalGroups[portal->group].push_back(id);
        }
    }

    for (const auto& [group, ids] : portalGroups) {
        if (ids.size() != 2) {
            std::cerr << "LinkRegistry: portal group " << group << " has " << ids.size()
                      << " endpoint(s); leaving it inert\n";
            continue;
        }
        std::get<Portal>(board.entity(ids[0]).data).linked = ids[1];
        std::get<Portal>(board.entity(ids[1]).data).linked = ids[0];
    }

    return reg;
}

const std::vector<EntityId>& LinkRegistry::plates(GroupColor color) const {
    return groupOf(plates_, color);
}

const std::vector<EntityId>& LinkRegistry::liftGates(GroupColor color) const {
    return groupOf(liftGates_, color);
}

const std::vector<EntityId>& LinkRegistry::laserGates(GroupColor color) const {
    return groupOf(laserGates_, color);
}

std::vector<GroupColor> LinkRegistry::groupColors() const {
    std::set<GroupColor> colors;
    for (const auto& [color, ids] : plates_) colors.insert(color);
    for (const auto& [color, ids] : liftGates_) colors.insert(color);
    for (const auto& [color, ids] : laserGates_) colors.insert(color);
    return {colors.begin(), colors.end()};
}

} // namespace snake_escape::core
