#include "memory.hpp"
#include "util.hpp"

namespace substrate {

std::string content_key(const Content& content) {
    if (content.is_string()) return content.get<std::string>();
    // Invalid UTF-8 inside nested strings becomes U+FFFD instead of throwing.
    return content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string scope_to_string(MemoryScope scope) {
    switch (scope) {
        case MemoryScope::ShortTerm: return "stm";
        case MemoryScope::LongTerm:  return "ltm";
        case MemoryScope::All:       return "all";
    }
    return "all";
}

std::optional<MemoryScope> scope_from_string(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "stm" || lower == "short_term") return MemoryScope::ShortTerm;
    if (lower == "ltm" || lower == "long_term")  return MemoryScope::LongTerm;
    if (lower == "all")                          return MemoryScope::All;
    return std::nullopt;
}

nlohmann::json item_to_json(const MemoryItem& item) {
    nlohmann::json j = {
        {"content", item.content},
        {"created_at", item.created_at},
        {"access_count", item.access_count},
        {"importance", item.importance},
        {"tags", nlohmann::json::array()}
    };
    for (const auto& tag : item.tags) {
        j["tags"].push_back(tag);
    }
    return j;
}

} // namespace substrate
