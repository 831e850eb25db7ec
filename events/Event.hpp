#pragma once

#include <string>
#include <memory>
#include <utility>

// Base class for application events dispatched through EventManager.
class Event {
public:
    using Ptr = std::shared_ptr<Event>;
    virtual ~Event() = default;

    // Short name for log lines
    virtual std::string name() const = 0;
};

template<typename T, typename... Args>
inline std::shared_ptr<T> make_event(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// Receives events from EventManager. Implementations run on the render
// thread inside update(), so they must not block.
class IEventHandler {
public:
    using EventPtr = Event::Ptr;
    virtual ~IEventHandler() = default;

    virtual void onEvent(const EventPtr &event) = 0;
};
