#include <catch2/catch.hpp>
#include "event_bus.hpp"

using namespace substrate;

// ── Publish / subscribe ─────────────────────────────────────────

TEST_CASE("EventBus: tag subscribers receive matching events only", "[event_bus]") {
    EventBus bus;
    int stored = 0;
    int evicted = 0;

    bus.subscribe(ItemStoredEvent::TAG, [&](const Event&) { stored++; });
    bus.subscribe(ItemEvictedEvent::TAG, [&](const Event&) { evicted++; });

    ItemStoredEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);
    ItemEvictedEvent ev2;
    bus.publish(ev2);

    REQUIRE(stored == 2);
    REQUIRE(evicted == 1);
}

TEST_CASE("EventBus: catch-all subscribers run after tag subscribers", "[event_bus]") {
    EventBus bus;
    std::vector<std::string> order;

    bus.subscribe_any([&](const Event& e) { order.push_back(std::string("any:") + e.type_tag); });
    bus.subscribe(ItemPromotedEvent::TAG, [&](const Event&) { order.push_back("tag"); });

    ItemPromotedEvent ev;
    bus.publish(ev);

    REQUIRE(order == std::vector<std::string>{"tag", "any:ItemPromoted"});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    MemoryClearedEvent ev;
    bus.publish(ev); // should not crash
}

TEST_CASE("EventBus: unsubscribe works for both kinds of subscription", "[event_bus]") {
    EventBus bus;
    int count = 0;

    uint64_t tag_id = bus.subscribe(ItemStoredEvent::TAG, [&](const Event&) { count++; });
    uint64_t any_id = bus.subscribe_any([&](const Event&) { count++; });
    REQUIRE(tag_id != any_id);

    ItemStoredEvent ev;
    bus.publish(ev);
    REQUIRE(count == 2);

    REQUIRE(bus.unsubscribe(tag_id));
    REQUIRE(bus.unsubscribe(any_id));
    REQUIRE_FALSE(bus.unsubscribe(any_id));
    bus.publish(ev);
    REQUIRE(count == 2);
}

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(ItemStoredEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe_any([&](const Event&) { count++; });

    bus.clear();

    ItemStoredEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
    REQUIRE(bus.subscriber_count(ItemStoredEvent::TAG) == 0);
}

TEST_CASE("EventBus: handlers may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late = 0;
    bus.subscribe(ItemStoredEvent::TAG, [&](const Event&) {
        bus.subscribe(ItemStoredEvent::TAG, [&](const Event&) { late++; });
    });

    ItemStoredEvent ev;
    bus.publish(ev);
    REQUIRE(late == 0);
    REQUIRE(bus.subscriber_count(ItemStoredEvent::TAG) == 2);
}

// ── Type-safe subscribe helper ──────────────────────────────────

TEST_CASE("EventBus: typed subscribe sees event payload", "[event_bus]") {
    EventBus bus;
    Content content;
    double score = -1.0;

    subscribe<ItemEvictedEvent>(bus, [&](const ItemEvictedEvent& ev) {
        content = ev.content;
        score = ev.score;
    });

    ItemEvictedEvent ev;
    ev.module = "MemorySystem";
    ev.content = "forgotten";
    ev.score = 0.0;
    bus.publish(ev);

    REQUIRE(content == "forgotten");
    REQUIRE(score == 0.0);
}

// ── PendingEvents ───────────────────────────────────────────────

TEST_CASE("PendingEvents: flush publishes in recording order", "[event_bus]") {
    EventBus bus;
    std::vector<std::string> tags;
    bus.subscribe_any([&](const Event& e) { tags.push_back(e.type_tag); });

    PendingEvents pending;
    pending.push(ItemStoredEvent{});
    pending.push(ItemDiscardedEvent{});
    REQUIRE(pending.size() == 2);
    REQUIRE(tags.empty());

    pending.flush(&bus);
    REQUIRE(tags == std::vector<std::string>{"ItemStored", "ItemDiscarded"});
    REQUIRE(pending.empty());
}

TEST_CASE("PendingEvents: events own copies of their payload", "[event_bus]") {
    EventBus bus;
    Content seen;
    subscribe<ItemStoredEvent>(bus, [&](const ItemStoredEvent& ev) { seen = ev.content; });

    PendingEvents pending;
    {
        ItemStoredEvent ev;
        ev.content = {{"k", "v"}};
        pending.push(ev);
    }
    pending.flush(&bus);
    REQUIRE(seen["k"] == "v");
}

TEST_CASE("PendingEvents: flush without a bus drops the queue", "[event_bus]") {
    PendingEvents pending;
    pending.push(MemoryReinforcedEvent{});
    pending.flush(nullptr);
    REQUIRE(pending.empty());
}
