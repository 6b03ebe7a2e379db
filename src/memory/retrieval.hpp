#pragma once
#include "short_term_store.hpp"
#include "long_term_store.hpp"
#include <vector>
#include <cstddef>

namespace substrate {

// Case-insensitive substring containment in either direction. Both
// arguments are search keys (see content_key()).
bool keys_match(const std::string& query_key, const std::string& item_key);

// Searches both tiers. Every match bumps the item's access_count by one.
// Holds references to the stores; must not outlive them. Not thread-safe.
class RetrievalEngine {
public:
    RetrievalEngine(ShortTermStore& stm, LongTermStore& ltm);

    // Exhaustive scan in store order, short-term before long-term.
    std::vector<Content> retrieve(const Content& query, MemoryScope scope);

    // Scans short-term then long-term and stops at `limit` matches; items
    // beyond the stopping point are not visited and not access-tracked.
    std::vector<Content> find_similar(const Content& query, size_t limit);

private:
    ShortTermStore& stm_;
    LongTermStore& ltm_;
};

} // namespace substrate
