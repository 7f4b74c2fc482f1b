#pragma once
#include "util.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace routekeeper {

class EventBus; // forward declaration

struct HealthPolicy {
    uint32_t failure_threshold = 3;
    std::chrono::milliseconds short_recovery{10 * 60 * 1000};  // lazy, on read
    std::chrono::milliseconds long_recovery{30 * 60 * 1000};   // eager, on sweep
    double latency_smoothing = 0.5;  // EMA weight of the newest sample
};

struct HealthRecord {
    std::string provider_id;
    bool healthy = true;
    uint32_t consecutive_failures = 0;
    uint64_t last_checked_ms = 0;
    double average_latency_ms = 0.0;
    uint64_t latency_samples = 0;
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
};

// Per-provider trust state. One record per provider id, created lazily and
// never deleted. A provider without a record is healthy.
//
// A single mutex guards the whole map: every read-modify-write (failure
// increment + threshold compare, lazy recovery) is atomic per record, and
// concurrent reports for the same id are applied in lock order.
class HealthMonitor {
public:
    explicit HealthMonitor(HealthPolicy policy = {}, NowFn now = epoch_millis);

    void record_outcome(const std::string& provider_id, bool success,
                        std::optional<double> latency_ms = std::nullopt);

    // Applies the short recovery rule: an unhealthy record whose
    // last_checked is at least short_recovery old is healed on read.
    bool is_healthy(const std::string& provider_id);

    // Heal every unhealthy record at least long_recovery old. Returns the
    // number of providers recovered.
    size_t sweep_long_recovery(uint64_t now_ms);

    // Create the default (healthy) record if none exists yet.
    void touch(const std::string& provider_id);

    std::optional<HealthRecord> record(const std::string& provider_id) const;
    std::vector<HealthRecord> snapshot() const;  // sorted by provider id
    size_t size() const;

    const HealthPolicy& policy() const { return policy_; }
    uint64_t now() const { return now_(); }

    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

private:
    HealthRecord& get_or_create(const std::string& provider_id);

    HealthPolicy policy_;
    NowFn now_;
    EventBus* event_bus_ = nullptr;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, HealthRecord> records_;
};

} // namespace routekeeper
