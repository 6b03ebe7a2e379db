#include "memory_system.hpp"
#include "event_bus.hpp"
#include "registry.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

static substrate::ModuleRegistrar reg_memory("memory",
    [](const substrate::Config& config) {
        return std::make_unique<substrate::MemorySystem>(config);
    });

namespace substrate {

namespace {

// Counts a process() call as in flight for its whole lifetime, including
// exits by exception. The module is Processing while the count is nonzero.
class ProcessingGuard {
public:
    explicit ProcessingGuard(std::atomic<uint32_t>& active) : active_(active) {
        active_.fetch_add(1);
    }
    ~ProcessingGuard() { active_.fetch_sub(1); }

    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    std::atomic<uint32_t>& active_;
};

std::vector<Content> contents_of(const std::vector<MemoryItem>& items) {
    std::vector<Content> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(item.content);
    }
    return out;
}

} // namespace

MemorySystem::MemorySystem(const MemoryConfig& cfg, const std::string& name)
    : name_(name),
      config_(cfg),
      stm_(cfg.stm_capacity),
      ltm_(cfg.ltm_capacity),
      policy_(cfg.promotion_threshold),
      retrieval_(stm_, ltm_) {}

MemorySystem::MemorySystem(const Config& config)
    : MemorySystem(config.memory, config.name) {}

CognitiveState MemorySystem::state() const {
    return active_calls_.load() > 0 ? CognitiveState::Processing : CognitiveState::Idle;
}

void MemorySystem::set_event_bus(EventBus* bus) {
    std::lock_guard<std::mutex> lock(mutex_);
    bus_ = bus;
}

void MemorySystem::publish(PendingEvents& events) {
    EventBus* bus = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bus = bus_;
    }
    events.flush(bus);
}

void MemorySystem::store_locked(MemoryItem item, PendingEvents& events) {
    item.sequence = next_sequence_++;
    if (item.created_at == 0) item.created_at = epoch_seconds();

    ItemStoredEvent stored;
    stored.module = name_;
    stored.content = item.content;
    stored.importance = item.importance;
    events.push(std::move(stored));

    auto overflow = stm_.store(std::move(item));
    if (!overflow) return;

    Content content = overflow->content;
    double importance = overflow->importance;
    auto outcome = policy_.consolidate(std::move(*overflow), ltm_);

    if (outcome.decision == ConsolidationDecision::Promoted) {
        ItemPromotedEvent ev;
        ev.module = name_;
        ev.content = std::move(content);
        ev.importance = importance;
        events.push(std::move(ev));
    } else {
        ItemDiscardedEvent ev;
        ev.module = name_;
        ev.content = std::move(content);
        ev.importance = importance;
        events.push(std::move(ev));
    }

    if (outcome.evicted) {
        ItemEvictedEvent ev;
        ev.module = name_;
        ev.score = outcome.evicted->eviction_score();
        ev.content = std::move(outcome.evicted->content);
        events.push(std::move(ev));
    }
}

Response MemorySystem::process(const nlohmann::json& input) {
    ProcessingGuard guard(active_calls_);
    PendingEvents events;
    Response response;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // TODO: process() remembers every input at the default importance,
        // independently of explicit store(); decide whether orchestrators
        // should opt in to this instead.
        MemoryItem item;
        item.content = input;
        item.importance = config_.default_importance;
        store_locked(std::move(item), events);

        auto similar = retrieval_.find_similar(input, config_.similar_limit);

        response.content = {
            {"stored", input},
            {"similar_memories", similar}
        };
        response.confidence = CONFIDENCE;
        response.source_module = name_;
        response.metadata = {{"memory_type", "short_term"}};
    }
    publish(events);
    return response;
}

void MemorySystem::update(const nlohmann::json& feedback) {
    if (!feedback.is_object() || !feedback.contains("reinforce")) return;

    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t touched = 0;
        stm_.visit_recent(config_.reinforce_window, [&](MemoryItem& item) {
            double boosted = item.importance * config_.reinforce_factor;
            if (!std::isnan(boosted)) item.importance = std::clamp(boosted, 0.0, 1.0);
            touched++;
            return true;
        });

        MemoryReinforcedEvent ev;
        ev.module = name_;
        ev.reinforced = touched;
        events.push(std::move(ev));
    }
    publish(events);
}

void MemorySystem::store(const Content& content, std::optional<double> importance,
                         const std::set<std::string>& tags) {
    MemoryItem item;
    item.content = content;
    item.tags = tags;
    double value = importance.value_or(config_.default_importance);
    item.importance = std::isnan(value) ? config_.default_importance
                                        : std::clamp(value, 0.0, 1.0);

    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_locked(std::move(item), events);
    }
    publish(events);
}

std::vector<Content> MemorySystem::retrieve(const Content& query, MemoryScope scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    return retrieval_.retrieve(query, scope);
}

std::vector<Content> MemorySystem::find_similar(const Content& query, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return retrieval_.find_similar(query, limit);
}

std::vector<Content> MemorySystem::get_stm_contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contents_of(stm_.snapshot());
}

std::vector<Content> MemorySystem::get_ltm_contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contents_of(ltm_.snapshot());
}

std::vector<MemoryItem> MemorySystem::stm_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stm_.snapshot();
}

std::vector<MemoryItem> MemorySystem::ltm_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ltm_.snapshot();
}

void MemorySystem::clear_locked(MemoryScope scope, PendingEvents& events) {
    size_t removed = 0;
    if (scope == MemoryScope::ShortTerm || scope == MemoryScope::All) removed += stm_.clear();
    if (scope == MemoryScope::LongTerm || scope == MemoryScope::All) removed += ltm_.clear();

    MemoryClearedEvent ev;
    ev.module = name_;
    ev.scope = scope;
    ev.removed = removed;
    events.push(std::move(ev));
}

void MemorySystem::clear_stm() {
    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_locked(MemoryScope::ShortTerm, events);
    }
    publish(events);
}

void MemorySystem::clear_ltm() {
    PendingEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_locked(MemoryScope::LongTerm, events);
    }
    publish(events);
}

nlohmann::json MemorySystem::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"name", name_},
        {"state", state_to_string(state())},
        {"stm_size", stm_.size()},
        {"stm_capacity", stm_.capacity()},
        {"ltm_size", ltm_.size()},
        {"ltm_capacity", ltm_.capacity()},
        {"promotion_threshold", policy_.threshold()}
    };
}

} // namespace substrate
