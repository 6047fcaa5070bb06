#pragma once

#include "Event.hpp"
#include <memory>

// Receiver side of the EventManager. Handlers run on the thread that
// publishes or drains the queue, which is the frame loop thread.
class IEventHandler {
public:
    using EventPtr = std::shared_ptr<Event>;
    virtual ~IEventHandler() = default;

    virtual void onEvent(const EventPtr &event) = 0;
};
