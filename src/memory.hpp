#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace substrate {

// Opaque stored value. Search only ever sees content_key() of it.
using Content = nlohmann::json;

enum class MemoryScope { ShortTerm, LongTerm, All };

struct MemoryItem {
    Content content;
    uint64_t created_at = 0;
    uint32_t access_count = 0;
    double importance = 0.5;       // [0, 1]
    std::set<std::string> tags;
    uint64_t sequence = 0;         // per-instance insertion order

    // importance * access_count; lowest is evicted first from long-term storage.
    double eviction_score() const {
        return importance * static_cast<double>(access_count);
    }
};

// Visitor over resident items of a store. Return false to stop the walk.
using ItemVisitor = std::function<bool(MemoryItem&)>;

// Stable string projection used as the search key: strings project to their
// raw text, everything else to its compact JSON dump.
std::string content_key(const Content& content);

// Scope string conversions. Accepts "stm"/"short_term", "ltm"/"long_term",
// "all". Unknown strings yield nullopt.
std::string scope_to_string(MemoryScope scope);
std::optional<MemoryScope> scope_from_string(const std::string& s);

nlohmann::json item_to_json(const MemoryItem& item);

} // namespace substrate
