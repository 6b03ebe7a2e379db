#include "event_bus.hpp"

namespace substrate {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

uint64_t EventBus::subscribe_any(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    any_handlers_.push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [tag, subs] : handlers_) {
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id == id) {
                subs.erase(it);
                return true;
            }
        }
    }
    for (auto it = any_handlers_.begin(); it != any_handlers_.end(); ++it) {
        if (it->id == id) {
            any_handlers_.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it != handlers_.end()) {
            for (const auto& sub : it->second) {
                to_call.push_back(sub.handler);
            }
        }
        for (const auto& sub : any_handlers_) {
            to_call.push_back(sub.handler);
        }
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    any_handlers_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

void PendingEvents::flush(EventBus* bus) {
    auto queue = std::move(queue_);
    queue_.clear();
    if (!bus) return;
    for (const auto& publish : queue) {
        publish(*bus);
    }
}

} // namespace substrate
