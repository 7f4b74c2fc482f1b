#include <catch2/catch.hpp>
#include "sweeper.hpp"
#include "health_monitor.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "errors.hpp"
#include "manual_clock.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

using namespace routekeeper;
using namespace std::chrono_literals;

static void fail_three(HealthMonitor& hm, const std::string& id) {
    for (int i = 0; i < 3; ++i) hm.record_outcome(id, false);
}

// ── run_once ─────────────────────────────────────────────────────

TEST_CASE("RecoverySweeper: run_once heals long-unhealthy providers", "[sweeper]") {
    ManualClock clock;
    HealthMonitor hm({}, clock.fn());
    RecoverySweeper sweeper(hm, 5min, clock.fn());

    fail_three(hm, "p");
    REQUIRE(sweeper.run_once() == std::optional<size_t>(0));

    clock.advance(30min);
    REQUIRE(sweeper.run_once() == std::optional<size_t>(1));
    REQUIRE(hm.record("p")->healthy);
    REQUIRE(sweeper.sweeps_completed() == 2);
}

TEST_CASE("RecoverySweeper: rejects non-positive interval", "[sweeper]") {
    HealthMonitor hm;
    REQUIRE_THROWS_AS(RecoverySweeper(hm, 0ms), ConfigError);
}

TEST_CASE("RecoverySweeper: overlapping run_once is skipped", "[sweeper][concurrency]") {
    ManualClock clock;
    EventBus bus;
    HealthMonitor hm({}, clock.fn());
    hm.set_event_bus(&bus);
    RecoverySweeper sweeper(hm, 5min, clock.fn());

    fail_three(hm, "p");
    clock.advance(30min);

    // Block the first sweep inside its recovery event handler
    std::mutex m;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    subscribe<ProviderRecoveredEvent>(bus, [&](const ProviderRecoveredEvent&) {
        std::unique_lock<std::mutex> lock(m);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&]() { return release; });
    });

    std::optional<size_t> first;
    std::thread t([&]() { first = sweeper.run_once(); });

    {
        std::unique_lock<std::mutex> lock(m);
        cv.wait(lock, [&]() { return entered; });
    }
    REQUIRE_FALSE(sweeper.run_once().has_value());
    REQUIRE(sweeper.ticks_skipped() == 1);

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();
    t.join();

    REQUIRE(first == std::optional<size_t>(1));
    REQUIRE(sweeper.sweeps_completed() == 1);
    // The busy flag is released afterwards
    REQUIRE(sweeper.run_once().has_value());
}

TEST_CASE("RecoverySweeper: publishes sweep completion", "[sweeper]") {
    ManualClock clock;
    EventBus bus;
    HealthMonitor hm({}, clock.fn());
    RecoverySweeper sweeper(hm, 5min, clock.fn());
    sweeper.set_event_bus(&bus);

    size_t recovered = 99;
    subscribe<SweepCompletedEvent>(bus, [&](const SweepCompletedEvent& ev) {
        recovered = ev.recovered;
    });
    sweeper.run_once();
    REQUIRE(recovered == 0);
}

// ── Background thread ────────────────────────────────────────────

TEST_CASE("RecoverySweeper: start and stop", "[sweeper]") {
    HealthMonitor hm;
    RecoverySweeper sweeper(hm, 5min);

    REQUIRE_FALSE(sweeper.running());
    REQUIRE(sweeper.start());
    REQUIRE(sweeper.running());
    REQUIRE_FALSE(sweeper.start());  // already running

    auto begin = std::chrono::steady_clock::now();
    sweeper.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    REQUIRE_FALSE(sweeper.running());
    REQUIRE(elapsed < 5s);  // woken, not waiting out the interval

    sweeper.stop();  // idempotent
}

TEST_CASE("RecoverySweeper: background ticks sweep on their own", "[sweeper]") {
    ManualClock clock;
    HealthMonitor hm({}, clock.fn());
    fail_three(hm, "cold");
    clock.advance(31min);

    RecoverySweeper sweeper(hm, 10ms, clock.fn());
    REQUIRE(sweeper.start());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!hm.record("cold")->healthy && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    sweeper.stop();

    REQUIRE(hm.record("cold")->healthy);
    REQUIRE(sweeper.sweeps_completed() >= 1);
}

TEST_CASE("RecoverySweeper: can be restarted after stop", "[sweeper]") {
    HealthMonitor hm;
    RecoverySweeper sweeper(hm, 10ms);
    REQUIRE(sweeper.start());
    sweeper.stop();
    REQUIRE(sweeper.start());
    REQUIRE(sweeper.running());
    sweeper.stop();
}

TEST_CASE("RecoverySweeper: destructor stops the thread", "[sweeper]") {
    HealthMonitor hm;
    {
        RecoverySweeper sweeper(hm, 10ms);
        sweeper.start();
    }
    SUCCEED("destroyed without hanging");
}

TEST_CASE("RecoverySweeper: stop waits for the in-flight sweep", "[sweeper][concurrency]") {
    ManualClock clock;
    EventBus bus;
    HealthMonitor hm({}, clock.fn());
    hm.set_event_bus(&bus);
    fail_three(hm, "p");
    clock.advance(31min);

    std::mutex m;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    subscribe<ProviderRecoveredEvent>(bus, [&](const ProviderRecoveredEvent&) {
        std::unique_lock<std::mutex> lock(m);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&]() { return release; });
    });

    RecoverySweeper sweeper(hm, 10ms, clock.fn());
    REQUIRE(sweeper.start());
    {
        std::unique_lock<std::mutex> lock(m);
        REQUIRE(cv.wait_for(lock, 5s, [&]() { return entered; }));
    }

    std::atomic<bool> stopped{false};
    uint64_t completed_at_stop = 0;
    std::thread stopper([&]() {
        sweeper.stop();
        completed_at_stop = sweeper.sweeps_completed();
        stopped = true;
    });

    // The sweep is parked in the handler, so stop() cannot have returned
    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(stopped.load());
    REQUIRE(sweeper.sweeps_completed() == 0);

    {
        std::lock_guard<std::mutex> lock(m);
        release = true;
    }
    cv.notify_all();
    stopper.join();

    REQUIRE(stopped.load());
    REQUIRE(completed_at_stop == 1);
    REQUIRE(hm.record("p")->healthy);
}

TEST_CASE("RecoverySweeper: handler on the sweeper thread may stop it", "[sweeper][concurrency]") {
    HealthMonitor hm;
    EventBus bus;
    auto sweeper = std::make_unique<RecoverySweeper>(hm, 10ms);
    sweeper->set_event_bus(&bus);

    std::atomic<int> handled{0};
    subscribe<SweepCompletedEvent>(bus, [&](const SweepCompletedEvent&) {
        handled++;
        sweeper->stop();
    });

    REQUIRE(sweeper->start());
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (sweeper->running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE_FALSE(sweeper->running());
    REQUIRE(handled.load() >= 1);

    // The self-stopped worker is joined on restart and again on destruction
    REQUIRE(sweeper->start());
    deadline = std::chrono::steady_clock::now() + 5s;
    while (sweeper->running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE_FALSE(sweeper->running());
    sweeper.reset();
    SUCCEED("destroyed without terminating");
}
