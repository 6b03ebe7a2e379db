#include "short_term_store.hpp"

namespace substrate {

ShortTermStore::ShortTermStore(size_t capacity) : capacity_(capacity) {}

std::optional<MemoryItem> ShortTermStore::store(MemoryItem item) {
    items_.push_back(std::move(item));
    if (items_.size() <= capacity_) return std::nullopt;

    MemoryItem oldest = std::move(items_.front());
    items_.pop_front();
    return oldest;
}

std::vector<MemoryItem> ShortTermStore::snapshot() const {
    return std::vector<MemoryItem>(items_.begin(), items_.end());
}

size_t ShortTermStore::clear() {
    size_t removed = items_.size();
    items_.clear();
    return removed;
}

void ShortTermStore::visit(const ItemVisitor& fn) {
    for (auto& item : items_) {
        if (!fn(item)) return;
    }
}

void ShortTermStore::visit_recent(size_t n, const ItemVisitor& fn) {
    size_t start = items_.size() > n ? items_.size() - n : 0;
    for (size_t i = start; i < items_.size(); ++i) {
        if (!fn(items_[i])) return;
    }
}

} // namespace substrate
