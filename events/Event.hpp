#pragma once

#include <string>
#include <memory>

// Base class for everything that travels through the EventManager
class Event {
public:
    using Ptr = std::shared_ptr<Event>;
    Event() = default;
    virtual ~Event() = default;

    // short runtime name for logging
    virtual std::string name() const { return "Event"; }

    // Downcast helper for handlers: nullptr when the event is of another type
    template<typename T>
    const T* as() const { return dynamic_cast<const T*>(this); }
};

template<typename T, typename... Args>
inline std::shared_ptr<T> make_event(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}
