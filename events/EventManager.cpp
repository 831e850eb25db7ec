#include "EventManager.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

void EventManager::subscribe(HandlerPtr handler) {
    if (!handler) return;
    if (std::find(handlers.begin(), handlers.end(), handler) == handlers.end()) {
        handlers.push_back(handler);
    }
}

void EventManager::unsubscribe(HandlerPtr handler) {
    handlers.erase(std::remove(handlers.begin(), handlers.end(), handler), handlers.end());
}

void EventManager::publish(const EventPtr &event) {
    if (!event) return;
    // handlers may unsubscribe from inside onEvent
    std::vector<HandlerPtr> snapshot = handlers;
    for (HandlerPtr h : snapshot) {
        try {
            h->onEvent(event);
        } catch (const std::exception &e) {
            std::cerr << "[EventManager] handler failed on " << event->name() << ": " << e.what() << "\n";
        }
    }
}

void EventManager::queue(const EventPtr &event) {
    if (!event) return;
    eventQueue.push_back(event);
}

size_t EventManager::processQueued() {
    // events queued by handlers during dispatch wait for the next call
    std::deque<EventPtr> pending;
    pending.swap(eventQueue);
    for (const EventPtr &e : pending) publish(e);
    return pending.size();
}
