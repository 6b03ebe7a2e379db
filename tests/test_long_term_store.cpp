#include <catch2/catch.hpp>
#include "memory/long_term_store.hpp"
#include <algorithm>

using namespace substrate;

static MemoryItem make_item(const std::string& text, double importance,
                            uint32_t access_count = 0) {
    MemoryItem item;
    item.content = text;
    item.importance = importance;
    item.access_count = access_count;
    return item;
}

static std::vector<std::string> texts(const std::vector<MemoryItem>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) out.push_back(item.content.get<std::string>());
    return out;
}

TEST_CASE("LongTermStore: insert below capacity evicts nothing", "[ltm]") {
    LongTermStore ltm(3);
    REQUIRE_FALSE(ltm.insert(make_item("a", 0.8)).has_value());
    REQUIRE_FALSE(ltm.insert(make_item("b", 0.8)).has_value());
    REQUIRE(texts(ltm.snapshot()) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("LongTermStore: equal scores evict the earliest insert", "[ltm]") {
    LongTermStore ltm(2);
    ltm.insert(make_item("one", 0.8));
    ltm.insert(make_item("two", 0.8));

    auto evicted = ltm.insert(make_item("three", 0.8));
    REQUIRE(evicted.has_value());
    REQUIRE(evicted->content == "one");
    REQUIRE(texts(ltm.snapshot()) == std::vector<std::string>{"two", "three"});
}

TEST_CASE("LongTermStore: lowest importance * access_count is evicted", "[ltm]") {
    LongTermStore ltm(3);
    ltm.insert(make_item("hot", 0.6, 10));      // 6.0
    ltm.insert(make_item("cold", 0.9, 2));      // 1.8
    ltm.insert(make_item("warm", 0.7, 5));      // 3.5

    auto evicted = ltm.insert(make_item("busy", 1.0, 4)); // 4.0
    REQUIRE(evicted.has_value());
    REQUIRE(evicted->content == "cold");
    REQUIRE(texts(ltm.snapshot()) == std::vector<std::string>{"hot", "warm", "busy"});
}

TEST_CASE("LongTermStore: unaccessed newcomer can be evicted immediately", "[ltm]") {
    LongTermStore ltm(2);
    ltm.insert(make_item("a", 0.6, 3));
    ltm.insert(make_item("b", 0.6, 1));

    auto evicted = ltm.insert(make_item("fresh", 1.0, 0));
    REQUIRE(evicted.has_value());
    REQUIRE(evicted->content == "fresh");
    REQUIRE(texts(ltm.snapshot()) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("LongTermStore: exactly one eviction per overflowing insert", "[ltm]") {
    LongTermStore ltm(4);
    for (int i = 0; i < 50; i++) {
        ltm.insert(make_item("m" + std::to_string(i), 0.9));
        REQUIRE(ltm.size() == std::min<size_t>(static_cast<size_t>(i) + 1, 4));
    }
}

TEST_CASE("LongTermStore: tie-break ignores position of higher scorers", "[ltm]") {
    LongTermStore ltm(3);
    ltm.insert(make_item("kept", 0.9, 3));
    ltm.insert(make_item("zero-1", 0.9, 0));
    ltm.insert(make_item("zero-2", 0.1, 0));

    auto evicted = ltm.insert(make_item("zero-3", 0.5, 0));
    REQUIRE(evicted.has_value());
    REQUIRE(evicted->content == "zero-1");
}

TEST_CASE("LongTermStore: clear is idempotent", "[ltm]") {
    LongTermStore ltm(2);
    ltm.insert(make_item("a", 0.9));
    REQUIRE(ltm.clear() == 1);
    REQUIRE(ltm.clear() == 0);
    REQUIRE(ltm.empty());
}
