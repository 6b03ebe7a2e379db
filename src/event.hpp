#pragma once
#include "memory.hpp"
#include <string>
#include <cstddef>

namespace substrate {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ItemStored       = "ItemStored";
    constexpr const char* ItemPromoted     = "ItemPromoted";
    constexpr const char* ItemDiscarded    = "ItemDiscarded";
    constexpr const char* ItemEvicted      = "ItemEvicted";
    constexpr const char* MemoryCleared    = "MemoryCleared";
    constexpr const char* MemoryReinforced = "MemoryReinforced";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// A new item entered short-term storage.
struct ItemStoredEvent : Event {
    static constexpr const char* TAG = event_tags::ItemStored;
    std::string module;
    Content content;
    double importance = 0.0;

    ItemStoredEvent() { type_tag = TAG; }
};

// An item pushed out of short-term storage moved to long-term storage.
struct ItemPromotedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemPromoted;
    std::string module;
    Content content;
    double importance = 0.0;

    ItemPromotedEvent() { type_tag = TAG; }
};

// An item pushed out of short-term storage was dropped.
struct ItemDiscardedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemDiscarded;
    std::string module;
    Content content;
    double importance = 0.0;

    ItemDiscardedEvent() { type_tag = TAG; }
};

// An item was permanently removed from long-term storage.
struct ItemEvictedEvent : Event {
    static constexpr const char* TAG = event_tags::ItemEvicted;
    std::string module;
    Content content;
    double score = 0.0;

    ItemEvictedEvent() { type_tag = TAG; }
};

struct MemoryClearedEvent : Event {
    static constexpr const char* TAG = event_tags::MemoryCleared;
    std::string module;
    MemoryScope scope = MemoryScope::All;
    size_t removed = 0;

    MemoryClearedEvent() { type_tag = TAG; }
};

struct MemoryReinforcedEvent : Event {
    static constexpr const char* TAG = event_tags::MemoryReinforced;
    std::string module;
    size_t reinforced = 0;

    MemoryReinforcedEvent() { type_tag = TAG; }
};

} // namespace substrate
