#include "long_term_store.hpp"

namespace substrate {

LongTermStore::LongTermStore(size_t capacity) : capacity_(capacity) {}

size_t LongTermStore::eviction_candidate() const {
    // items_ is in insertion order, so the first strict minimum wins ties.
    size_t victim = 0;
    double lowest = items_[0].eviction_score();
    for (size_t i = 1; i < items_.size(); ++i) {
        double score = items_[i].eviction_score();
        if (score < lowest) {
            lowest = score;
            victim = i;
        }
    }
    return victim;
}

std::optional<MemoryItem> LongTermStore::insert(MemoryItem item) {
    items_.push_back(std::move(item));
    if (items_.size() <= capacity_) return std::nullopt;

    auto it = items_.begin() + static_cast<ptrdiff_t>(eviction_candidate());
    MemoryItem evicted = std::move(*it);
    items_.erase(it);
    return evicted;
}

std::vector<MemoryItem> LongTermStore::snapshot() const {
    return items_;
}

size_t LongTermStore::clear() {
    size_t removed = items_.size();
    items_.clear();
    return removed;
}

void LongTermStore::visit(const ItemVisitor& fn) {
    for (auto& item : items_) {
        if (!fn(item)) return;
    }
}

} // namespace substrate
