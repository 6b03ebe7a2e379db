#pragma once
#include "../memory.hpp"
#include <optional>
#include <vector>
#include <cstddef>

namespace substrate {

// Bounded store of consolidated items. Residents keep insertion order.
// When an insert breaches capacity, exactly one item with the lowest
// eviction_score() is removed; ties go to the earliest-inserted item.
// Not thread-safe.
class LongTermStore {
public:
    explicit LongTermStore(size_t capacity);

    // Returns the evicted item if the insert breached capacity. The evicted
    // item may be the one just inserted.
    std::optional<MemoryItem> insert(MemoryItem item);

    std::vector<MemoryItem> snapshot() const;

    size_t clear();

    void visit(const ItemVisitor& fn);

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return items_.empty(); }

private:
    // Index of the eviction victim. Requires a non-empty store.
    size_t eviction_candidate() const;

    size_t capacity_;
    std::vector<MemoryItem> items_;
};

} // namespace substrate
