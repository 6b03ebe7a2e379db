#pragma once
#include "module.hpp"
#include "memory.hpp"
#include "config.hpp"
#include "memory/short_term_store.hpp"
#include "memory/long_term_store.hpp"
#include "memory/consolidation.hpp"
#include "memory/retrieval.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace substrate {

class EventBus;
class PendingEvents;

// Two-tier memory module: a bounded short-term buffer whose overflow is
// consolidated into a bounded, score-evicting long-term store.
//
// Every public method locks one per-instance mutex, so an instance may be
// shared between threads. Events are published after the lock is dropped.
class MemorySystem : public CognitiveModule {
public:
    explicit MemorySystem(const MemoryConfig& cfg = MemoryConfig{},
                          const std::string& name = "MemorySystem");
    explicit MemorySystem(const Config& config);

    MemorySystem(const MemorySystem&) = delete;
    MemorySystem& operator=(const MemorySystem&) = delete;

    // ── CognitiveModule ──────────────────────────────────────────

    std::string name() const override { return name_; }
    CognitiveState state() const override;

    // Stores `input` at the default importance, then looks for similar
    // memories (the input itself included). Confidence is always 0.9.
    Response process(const nlohmann::json& input) override;

    // Recognizes {"reinforce": <anything>}: the newest reinforce_window
    // short-term items get importance *= reinforce_factor, kept within [0, 1].
    // Everything else is ignored.
    void update(const nlohmann::json& feedback) override;

    // ── Memory operations ────────────────────────────────────────

    // Importance is clamped to [0, 1]; NaN or nullopt means the default.
    void store(const Content& content,
               std::optional<double> importance = std::nullopt,
               const std::set<std::string>& tags = {});

    std::vector<Content> retrieve(const Content& query,
                                  MemoryScope scope = MemoryScope::All);

    std::vector<Content> find_similar(const Content& query, size_t limit);

    std::vector<Content> get_stm_contents() const;
    std::vector<Content> get_ltm_contents() const;

    std::vector<MemoryItem> stm_snapshot() const;
    std::vector<MemoryItem> ltm_snapshot() const;

    void clear_stm();
    void clear_ltm();

    nlohmann::json status() const;

    const MemoryConfig& config() const { return config_; }

    // The bus must outlive this instance. Pass nullptr to detach.
    void set_event_bus(EventBus* bus);

    static constexpr double CONFIDENCE = 0.9;

private:
    // Callers hold mutex_.
    void store_locked(MemoryItem item, PendingEvents& events);
    void clear_locked(MemoryScope scope, PendingEvents& events);

    void publish(PendingEvents& events);

    std::string name_;
    MemoryConfig config_;
    std::atomic<uint32_t> active_calls_{0};   // process() calls in flight

    ShortTermStore stm_;
    LongTermStore ltm_;
    ConsolidationPolicy policy_;
    RetrievalEngine retrieval_;
    uint64_t next_sequence_ = 1;

    EventBus* bus_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace substrate
