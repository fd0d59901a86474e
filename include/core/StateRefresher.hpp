#pragma once

#include "Events.hpp"
#include "World.hpp"

namespace snake_escape::core {

// Recomputes derived state after every board mutation:
//   1. plates  - active iff a snake segment, Box or IceCube stands on them
//   2. gates   - per color group; lift gates open when every plate of the
//                group is active and close only once vacated, lasers are
//                the inverse and strike their cell when arming
//   3. portals - active iff linked and the partner cell is unobstructed
// Events are emitted on transitions only.
class StateRefresher {
public:
    StateRefresher(World& world, EventBuffer& events);

    void refresh();

private:
    World& world_;
    EventBuffer& events_;

    void platePass();
    bool gatePass(); // true if an arming laser destroyed or cut something
    void portalPass();
};

} // namespace snake_escape::core
