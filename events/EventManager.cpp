#include "EventManager.hpp"
#include <algorithm>

EventManager::~EventManager() {
    std::lock_guard<std::mutex> ql(queueMutex);
    while (!eventQueue.empty()) eventQueue.pop();
    std::lock_guard<std::mutex> hl(handlersMutex);
    handlers.clear();
}

void EventManager::subscribe(HandlerPtr handler) {
    if (!handler) return;
    std::lock_guard<std::mutex> lock(handlersMutex);
    if (std::find(handlers.begin(), handlers.end(), handler) == handlers.end()) {
        handlers.push_back(handler);
    }
}

void EventManager::unsubscribe(HandlerPtr handler) {
    if (!handler) return;
    std::lock_guard<std::mutex> lock(handlersMutex);
    handlers.erase(std::remove(handlers.begin(), handlers.end(), handler), handlers.end());
}

void EventManager::publish(const EventPtr &event) {
    if (!event) return;
    // snapshot so handlers may (un)subscribe while being called
    std::vector<HandlerPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        snapshot = handlers;
    }
    for (HandlerPtr handler : snapshot) {
        handler->onEvent(event);
    }
}

void EventManager::queue(const EventPtr &event) {
    if (!event) return;
    std::lock_guard<std::mutex> lock(queueMutex);
    eventQueue.push(event);
}

void EventManager::processQueued() {
    std::vector<EventPtr> events;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        while (!eventQueue.empty()) {
            events.push_back(eventQueue.front());
            eventQueue.pop();
        }
    }
    for (auto &e : events) publish(e);
}

size_t EventManager::handlerCount() {
    std::lock_guard<std::mutex> lock(handlersMutex);
    return handlers.size();
}

size_t EventManager::queuedCount() {
    std::lock_guard<std::mutex> lock(queueMutex);
    return eventQueue.size();
}
