#pragma once

#include "Events.hpp"
#include "World.hpp"

namespace snake_escape::core {

// Hole filling and laser damage. Shared by the movement resolver (objects
// arriving, snakes entering) and the state refresher (lasers arming).

// Applies hazards to a Box/IceCube that just arrived at its footprint.
// `origin` is the anchor it was pushed from. A footprint lying entirely on
// holes destroys the object and those holes; a footprint lying entirely on
// active lasers destroys the object. Returns true if the object is gone.
bool settlePushable(World& world, EntityId id, Cell origin, EventBuffer& events);

// Cuts the snake at c (see Snake::sliceAt) and removes it from play when
// nothing is left. Returns true if the snake was removed.
bool sliceSnake(World& world, SnakeId id, Cell c, EventBuffer& events);

// Laser at c just armed: destroy or slice whatever stands on it.
// Returns true if anything was destroyed or cut.
bool strikeCell(World& world, Cell c, EventBuffer& events);

} // namespace snake_escape::core
