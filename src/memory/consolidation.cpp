#include "consolidation.hpp"

namespace substrate {

ConsolidationOutcome ConsolidationPolicy::consolidate(MemoryItem item,
                                                      LongTermStore& ltm) const {
    ConsolidationOutcome outcome;
    if (!should_promote(item)) return outcome;

    outcome.decision = ConsolidationDecision::Promoted;
    outcome.evicted = ltm.insert(std::move(item));
    return outcome;
}

} // namespace substrate
