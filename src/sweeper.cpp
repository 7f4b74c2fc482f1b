#include "sweeper.hpp"
#include "health_monitor.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include <iostream>

namespace routekeeper {

RecoverySweeper::RecoverySweeper(HealthMonitor& health,
                                 std::chrono::milliseconds interval,
                                 NowFn now)
    : health_(health), interval_(interval), now_(std::move(now)) {
    if (interval_.count() <= 0) {
        throw ConfigError("sweep interval must be positive");
    }
    if (!now_) now_ = epoch_millis;
}

RecoverySweeper::~RecoverySweeper() {
    stop();
    if (thread_.joinable()) {
        // Destroyed from inside one of our own event handlers
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

bool RecoverySweeper::reap_worker() {
    if (!thread_.joinable()) return true;
    if (thread_.get_id() == std::this_thread::get_id()) return false;
    thread_.join();
    return true;
}

bool RecoverySweeper::start() {
    if (running_.load()) return false;
    // A worker told to stop from its own thread is still unwinding; it
    // cannot be restarted from that thread.
    if (!reap_worker()) return false;
    if (running_.exchange(true)) return false;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this]() { loop(); });
    std::cerr << "[sweeper] Started, interval " << interval_.count() << "ms\n";
    return true;
}

void RecoverySweeper::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    // From the worker itself the loop exits once the current tick returns;
    // the thread is joined by the next start() or the destructor.
    reap_worker();
    std::cerr << "[sweeper] Stopped after " << sweeps_completed_.load() << " sweeps\n";
}

std::optional<size_t> RecoverySweeper::run_once() {
    if (busy_.exchange(true)) {
        ticks_skipped_++;
        return std::nullopt;
    }

    struct BusyGuard {
        std::atomic<bool>& flag;
        ~BusyGuard() { flag.store(false); }
    } guard{busy_};

    size_t recovered = health_.sweep_long_recovery(now_());
    sweeps_completed_++;

    if (recovered > 0) {
        std::cerr << "[sweeper] Recovered " << recovered << " provider(s)\n";
    }
    SweepCompletedEvent ev;
    ev.recovered = recovered;
    publish_to(event_bus_, ev);
    return recovered;
}

void RecoverySweeper::loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (!stop_requested_) {
        if (wake_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            run_once();
        } catch (const std::exception& e) {
            std::cerr << "[sweeper] Sweep failed: " << e.what() << "\n";
        }
        lock.lock();
    }
}

} // namespace routekeeper
