#include <catch2/catch.hpp>
#include "reporter.hpp"
#include "health_monitor.hpp"
#include "manual_clock.hpp"
#include <vector>

using namespace routekeeper;

// ── Mock reporter for code that only sees the interface ──────────

class RecordingReporter : public OutcomeReporter {
public:
    struct Call {
        std::string provider_id;
        bool success;
        std::optional<double> latency_ms;
    };
    std::vector<Call> calls;

    void report(const std::string& provider_id, bool success,
                std::optional<double> latency_ms) override {
        calls.push_back({provider_id, success, latency_ms});
    }
};

// Stand-in for a caller: invokes "the provider" and reports the outcome.
static void call_and_report(OutcomeReporter& reporter, const std::string& id, bool ok) {
    reporter.report(id, ok, ok ? std::optional<double>(120.0) : std::nullopt);
}

TEST_CASE("OutcomeReporter: interface is mockable", "[reporter]") {
    RecordingReporter mock;
    call_and_report(mock, "p1", true);
    call_and_report(mock, "p1", false);

    REQUIRE(mock.calls.size() == 2);
    REQUIRE(mock.calls[0].success);
    REQUIRE(mock.calls[0].latency_ms == 120.0);
    REQUIRE_FALSE(mock.calls[1].success);
    REQUIRE_FALSE(mock.calls[1].latency_ms.has_value());
}

TEST_CASE("HealthOutcomeReporter: forwards to the health monitor", "[reporter]") {
    ManualClock clock;
    HealthMonitor hm({}, clock.fn());
    HealthOutcomeReporter reporter(hm);

    reporter.report("p1", true, 80.0);
    REQUIRE(hm.record("p1")->average_latency_ms == 80.0);

    for (int i = 0; i < 3; ++i) reporter.report("p1", false);
    REQUIRE_FALSE(hm.is_healthy("p1"));

    reporter.report("p1", true);
    REQUIRE(hm.is_healthy("p1"));
}

TEST_CASE("HealthOutcomeReporter: usable through the base interface", "[reporter]") {
    ManualClock clock;
    HealthMonitor hm({}, clock.fn());
    HealthOutcomeReporter concrete(hm);
    OutcomeReporter& reporter = concrete;

    for (int i = 0; i < 3; ++i) call_and_report(reporter, "p2", false);
    REQUIRE(hm.record("p2")->consecutive_failures == 3);
}
