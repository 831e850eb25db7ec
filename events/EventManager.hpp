#pragma once

#include "Event.hpp"
#include <vector>
#include <deque>
#include <cstddef>

// Publish/subscribe bus. Everything runs on the render thread: publishers
// (keyboard, widgets) queue events during a frame and the application drains
// them once per update().
class EventManager {
public:
    using EventPtr = Event::Ptr;
    using HandlerPtr = IEventHandler*; // non-owning, caller manages lifetime

    EventManager() = default;

    // Duplicate registrations are ignored.
    void subscribe(HandlerPtr handler);
    void unsubscribe(HandlerPtr handler);

    // Dispatch to every handler right away. A handler that throws is logged
    // and skipped; the remaining handlers still receive the event.
    void publish(const EventPtr &event);

    // Deferred dispatch, FIFO, delivered by processQueued().
    void queue(const EventPtr &event);
    // Returns the number of events dispatched.
    size_t processQueued();

    size_t handlerCount() const { return handlers.size(); }
    size_t queuedCount() const { return eventQueue.size(); }

private:
    std::vector<HandlerPtr> handlers;
    std::deque<EventPtr> eventQueue;
};
