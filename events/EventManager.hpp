#pragma once

#include "Event.hpp"
#include "IEventHandler.hpp"
#include <vector>
#include <memory>
#include <mutex>
#include <queue>

// Fan-out of input and window events to subscribed handlers. Events are either
// dispatched immediately (publish) or deferred to the next processQueued call,
// which lets platform callbacks hand work over to the frame loop.
class EventManager {
public:
    using EventPtr = std::shared_ptr<Event>;
    using HandlerPtr = IEventHandler*; // non-owning

    EventManager() = default;
    ~EventManager();

    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;

    // Duplicate registrations are ignored
    void subscribe(HandlerPtr handler);
    void unsubscribe(HandlerPtr handler);

    // Dispatches to every handler subscribed at the time of the call.
    // Exceptions thrown by a handler propagate to the publisher.
    void publish(const EventPtr &event);

    void queue(const EventPtr &event);

    // Dispatches queued events in FIFO order; events queued while draining
    // wait for the next call
    void processQueued();

    size_t handlerCount();
    size_t queuedCount();

private:
    std::mutex handlersMutex;
    std::vector<HandlerPtr> handlers; // guarded by handlersMutex

    std::mutex queueMutex;
    std::queue<EventPtr> eventQueue; // guarded by queueMutex
};
