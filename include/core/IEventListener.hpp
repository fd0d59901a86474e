#pragma once

#include "Events.hpp"

namespace snake_escape::core {

// Observer for domain events published by a GameSession.
// Rendering/animation collaborators implement this.
class IEventListener {
public:
    virtual ~IEventListener() = default;

    virtual void onEvent(const DomainEvent& event) = 0;
};

} // namespace snake_escape::core
