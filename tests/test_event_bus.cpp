#include <catch2/catch.hpp>
#include "event_bus.hpp"

using namespace routekeeper;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(ProviderUnhealthyEvent::TAG, [&](const Event&) { count++; });

    ProviderUnhealthyEvent ev;
    ev.provider_id = "p";
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: handlers run in registration order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;
    bus.subscribe(FallbackSelectedEvent::TAG, [&](const Event&) { order.push_back(1); });
    bus.subscribe(FallbackSelectedEvent::TAG, [&](const Event&) { order.push_back(2); });

    FallbackSelectedEvent ev;
    bus.publish(ev);
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    RoutingExhaustedEvent ev;
    REQUIRE(bus.publish(ev) == 0);
}

TEST_CASE("EventBus: tags are independent", "[event_bus]") {
    EventBus bus;
    int unhealthy = 0;
    int recovered = 0;
    bus.subscribe(ProviderUnhealthyEvent::TAG, [&](const Event&) { unhealthy++; });
    bus.subscribe(ProviderRecoveredEvent::TAG, [&](const Event&) { recovered++; });

    ProviderUnhealthyEvent u;
    bus.publish(u);
    bus.publish(u);
    ProviderRecoveredEvent r;
    bus.publish(r);

    REQUIRE(unhealthy == 2);
    REQUIRE(recovered == 1);
}

// ── Unsubscribe / clear ─────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = bus.subscribe(SweepCompletedEvent::TAG, [&](const Event&) { count++; });

    SweepCompletedEvent ev;
    bus.publish(ev);
    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1);
    REQUIRE_FALSE(bus.unsubscribe(id));
}

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    bus.subscribe(ProviderUnhealthyEvent::TAG, [](const Event&) {});
    bus.subscribe(EmergencySelectedEvent::TAG, [](const Event&) {});
    bus.clear();
    REQUIRE(bus.subscriber_count(ProviderUnhealthyEvent::TAG) == 0);
    REQUIRE(bus.subscriber_count(EmergencySelectedEvent::TAG) == 0);
}

// ── Typed helpers ───────────────────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe template", "[event_bus]") {
    EventBus bus;
    std::string captured;
    RecoveryReason reason = RecoveryReason::Success;

    subscribe<ProviderRecoveredEvent>(bus, [&](const ProviderRecoveredEvent& ev) {
        captured = ev.provider_id;
        reason = ev.reason;
    });

    ProviderRecoveredEvent ev;
    ev.provider_id = "tts-a";
    ev.reason = RecoveryReason::LongSweep;
    bus.publish(ev);

    REQUIRE(captured == "tts-a");
    REQUIRE(reason == RecoveryReason::LongSweep);
    REQUIRE(std::string(recovery_reason_to_string(reason)) == "long_sweep");
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late = 0;
    bus.subscribe(FallbackSelectedEvent::TAG, [&](const Event&) {
        bus.subscribe(FallbackSelectedEvent::TAG, [&](const Event&) { late++; });
    });

    FallbackSelectedEvent ev;
    bus.publish(ev);  // must not deadlock
    REQUIRE(late == 0);
    bus.publish(ev);
    REQUIRE(late == 1);
}

TEST_CASE("publish_to: null bus is ignored", "[event_bus]") {
    ProviderUnhealthyEvent ev;
    publish_to(nullptr, ev);

    EventBus bus;
    int count = 0;
    subscribe<ProviderUnhealthyEvent>(bus, [&](const ProviderUnhealthyEvent&) { count++; });
    publish_to(&bus, ev);
    REQUIRE(count == 1);
}

// ── Publish counts ──────────────────────────────────────────────

TEST_CASE("EventBus: counts publishes per tag without subscribers", "[event_bus]") {
    EventBus bus;
    FallbackSelectedEvent fb;
    bus.publish(fb);
    bus.publish(fb);
    ProviderUnhealthyEvent u;
    bus.publish(u);

    REQUIRE(bus.published(FallbackSelectedEvent::TAG) == 2);
    REQUIRE(bus.published(ProviderUnhealthyEvent::TAG) == 1);
    REQUIRE(bus.published(SweepCompletedEvent::TAG) == 0);

    auto counts = bus.published_counts();
    REQUIRE(counts.size() == 2);
    REQUIRE(counts["FallbackSelected"] == 2);
}

TEST_CASE("EventBus: clear keeps publish counts", "[event_bus]") {
    EventBus bus;
    bus.subscribe(RoutingExhaustedEvent::TAG, [](const Event&) {});
    RoutingExhaustedEvent ev;
    bus.publish(ev);
    bus.clear();
    REQUIRE(bus.publish(ev) == 0);
    REQUIRE(bus.published(RoutingExhaustedEvent::TAG) == 2);
}

TEST_CASE("EventBus: unsubscribe only touches its own tag", "[event_bus]") {
    EventBus bus;
    int a = 0;
    int b = 0;
    uint64_t first = bus.subscribe(ProviderUnhealthyEvent::TAG, [&](const Event&) { a++; });
    bus.subscribe(ProviderUnhealthyEvent::TAG, [&](const Event&) { b++; });
    uint64_t other = bus.subscribe(SweepCompletedEvent::TAG, [](const Event&) {});

    REQUIRE(bus.unsubscribe(first));
    REQUIRE(bus.subscriber_count(ProviderUnhealthyEvent::TAG) == 1);
    REQUIRE(bus.subscriber_count(SweepCompletedEvent::TAG) == 1);

    ProviderUnhealthyEvent ev;
    bus.publish(ev);
    REQUIRE(a == 0);
    REQUIRE(b == 1);

    REQUIRE(bus.unsubscribe(other));
    REQUIRE(bus.subscriber_count(SweepCompletedEvent::TAG) == 0);
}

TEST_CASE("EventBus: handler may unsubscribe itself", "[event_bus]") {
    EventBus bus;
    int calls = 0;
    uint64_t id = 0;
    id = bus.subscribe(EmergencySelectedEvent::TAG, [&](const Event&) {
        calls++;
        bus.unsubscribe(id);
    });

    EmergencySelectedEvent ev;
    bus.publish(ev);
    bus.publish(ev);
    REQUIRE(calls == 1);
}
