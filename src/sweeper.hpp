#pragma once
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace routekeeper {

class HealthMonitor; // forward declaration
class EventBus;

constexpr std::chrono::milliseconds kDefaultSweepInterval{5 * 60 * 1000};

// Periodic background pass calling HealthMonitor::sweep_long_recovery.
// Runs its loop in a background thread; sweeps never overlap.
class RecoverySweeper {
public:
    explicit RecoverySweeper(HealthMonitor& health,
                             std::chrono::milliseconds interval = kDefaultSweepInterval,
                             NowFn now = epoch_millis);
    ~RecoverySweeper();

    RecoverySweeper(const RecoverySweeper&) = delete;
    RecoverySweeper& operator=(const RecoverySweeper&) = delete;

    // Start the background thread. Returns false if already running.
    bool start();

    // Stop scheduling ticks and join; an in-flight sweep finishes first.
    // Safe to call from an event handler running on the sweeper thread,
    // in which case the join is deferred to start() or the destructor.
    void stop();

    bool running() const { return running_.load(); }

    // One sweep, single-flight: returns nullopt (and counts a skipped tick)
    // when another sweep is still in progress, otherwise the number of
    // providers recovered.
    std::optional<size_t> run_once();

    uint64_t sweeps_completed() const { return sweeps_completed_.load(); }
    uint64_t ticks_skipped() const { return ticks_skipped_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

private:
    void loop();
    // Join a finished worker. False if the caller is the worker itself.
    bool reap_worker();

    HealthMonitor& health_;
    std::chrono::milliseconds interval_;
    NowFn now_;
    EventBus* event_bus_ = nullptr;

    std::atomic<bool> running_{false};
    std::atomic<bool> busy_{false};
    std::atomic<uint64_t> sweeps_completed_{0};
    std::atomic<uint64_t> ticks_skipped_{0};

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::thread thread_;
};

} // namespace routekeeper
