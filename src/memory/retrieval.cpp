#include "retrieval.hpp"
#include "../util.hpp"

namespace substrate {

bool keys_match(const std::string& query_key, const std::string& item_key) {
    if (query_key.empty()) return false;
    std::string q = to_lower(query_key);
    std::string c = to_lower(item_key);
    return c.find(q) != std::string::npos || q.find(c) != std::string::npos;
}

RetrievalEngine::RetrievalEngine(ShortTermStore& stm, LongTermStore& ltm)
    : stm_(stm), ltm_(ltm) {}

std::vector<Content> RetrievalEngine::retrieve(const Content& query, MemoryScope scope) {
    std::string query_key = content_key(query);
    if (query_key.empty()) return {};

    std::vector<Content> results;
    ItemVisitor collect = [&](MemoryItem& item) {
        if (keys_match(query_key, content_key(item.content))) {
            item.access_count++;
            results.push_back(item.content);
        }
        return true;
    };

    if (scope == MemoryScope::ShortTerm || scope == MemoryScope::All) {
        stm_.visit(collect);
    }
    if (scope == MemoryScope::LongTerm || scope == MemoryScope::All) {
        ltm_.visit(collect);
    }
    return results;
}

std::vector<Content> RetrievalEngine::find_similar(const Content& query, size_t limit) {
    std::string query_key = content_key(query);
    if (query_key.empty() || limit == 0) return {};

    std::vector<Content> results;
    ItemVisitor collect = [&](MemoryItem& item) {
        if (keys_match(query_key, content_key(item.content))) {
            item.access_count++;
            results.push_back(item.content);
        }
        return results.size() < limit;
    };

    stm_.visit(collect);
    if (results.size() < limit) {
        ltm_.visit(collect);
    }
    return results;
}

} // namespace substrate
