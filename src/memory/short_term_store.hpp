#pragma once
#include "../memory.hpp"
#include <deque>
#include <optional>
#include <vector>
#include <cstddef>

namespace substrate {

// Bounded recency buffer. Insertion-ordered; overflow pushes out the oldest
// item, which the caller is expected to hand to a ConsolidationPolicy.
// Not thread-safe.
class ShortTermStore {
public:
    explicit ShortTermStore(size_t capacity);

    // Append to the tail. Returns the evicted head if capacity was exceeded.
    std::optional<MemoryItem> store(MemoryItem item);

    std::vector<MemoryItem> snapshot() const;

    // Returns the number of items removed (0 on an already empty store).
    size_t clear();

    // Oldest to newest.
    void visit(const ItemVisitor& fn);

    // The newest up-to-n items, oldest of them first.
    void visit_recent(size_t n, const ItemVisitor& fn);

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return items_.empty(); }

private:
    size_t capacity_;
    std::deque<MemoryItem> items_;
};

} // namespace substrate
