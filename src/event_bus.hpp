#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace substrate {

using EventHandler = std::function<void(const Event&)>;

class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Subscribe to every event regardless of tag (tracing, tests).
    uint64_t subscribe_any(EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously. Tag subscribers run first in registration
    // order, then catch-all subscribers. Handlers are invoked without the
    // bus mutex held, so they may subscribe or publish themselves.
    void publish(const Event& event);

    void clear();

    // Number of tag subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    std::vector<Subscription> any_handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Events recorded while a module holds its own lock, published later once
// the lock is released. Each entry owns a copy of its event.
class PendingEvents {
public:
    template<typename E>
    void push(E event) {
        queue_.emplace_back([ev = std::move(event)](EventBus& bus) { bus.publish(ev); });
    }

    // Publishes everything in recording order and empties the queue. A null
    // bus just drops the queue.
    void flush(EventBus* bus);

    bool empty() const { return queue_.empty(); }
    size_t size() const { return queue_.size(); }

private:
    std::vector<std::function<void(EventBus&)>> queue_;
};

} // namespace substrate
