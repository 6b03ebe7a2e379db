#pragma once
#include "long_term_store.hpp"
#include <optional>

namespace substrate {

enum class ConsolidationDecision { Promoted, Discarded };

struct ConsolidationOutcome {
    ConsolidationDecision decision = ConsolidationDecision::Discarded;
    // Set when the promotion pushed long-term storage over capacity.
    std::optional<MemoryItem> evicted;
};

// Decides what happens to an item pushed out of short-term storage:
// promoted to long-term storage whole, or dropped. The item itself is
// never modified.
class ConsolidationPolicy {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.5;

    explicit ConsolidationPolicy(double threshold = DEFAULT_THRESHOLD)
        : threshold_(threshold) {}

    // Strictly greater than the threshold.
    bool should_promote(const MemoryItem& item) const {
        return item.importance > threshold_;
    }

    ConsolidationOutcome consolidate(MemoryItem item, LongTermStore& ltm) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

} // namespace substrate
