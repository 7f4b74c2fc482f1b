#include "health_monitor.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>

namespace routekeeper {

static uint64_t elapsed_since(uint64_t now_ms, uint64_t then_ms) {
    // A clock that stepped backwards counts as no time elapsed.
    return now_ms > then_ms ? now_ms - then_ms : 0;
}

static void heal(HealthRecord& rec) {
    rec.healthy = true;
    rec.consecutive_failures = 0;
}

HealthMonitor::HealthMonitor(HealthPolicy policy, NowFn now)
    : policy_(policy), now_(std::move(now)) {
    if (policy_.failure_threshold == 0) {
        throw ConfigError("failure_threshold must be at least 1");
    }
    if (policy_.latency_smoothing <= 0.0 || policy_.latency_smoothing > 1.0) {
        throw ConfigError("latency_smoothing must be in (0, 1]");
    }
    if (!now_) now_ = epoch_millis;
}

HealthRecord& HealthMonitor::get_or_create(const std::string& provider_id) {
    auto it = records_.find(provider_id);
    if (it != records_.end()) return it->second;

    HealthRecord rec;
    rec.provider_id = provider_id;
    rec.last_checked_ms = now_();
    return records_.emplace(provider_id, std::move(rec)).first->second;
}

void HealthMonitor::record_outcome(const std::string& provider_id, bool success,
                                   std::optional<double> latency_ms) {
    bool became_unhealthy = false;
    bool recovered = false;
    uint32_t failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        HealthRecord& rec = get_or_create(provider_id);
        rec.last_checked_ms = now_();

        if (success) {
            recovered = !rec.healthy;
            heal(rec);
            rec.total_successes++;
            if (latency_ms && *latency_ms >= 0.0) {
                if (rec.latency_samples == 0) {
                    rec.average_latency_ms = *latency_ms;
                } else {
                    double a = policy_.latency_smoothing;
                    rec.average_latency_ms = a * *latency_ms + (1.0 - a) * rec.average_latency_ms;
                }
                rec.latency_samples++;
            }
        } else {
            rec.consecutive_failures++;
            rec.total_failures++;
            failures = rec.consecutive_failures;
            if (rec.healthy && rec.consecutive_failures >= policy_.failure_threshold) {
                rec.healthy = false;
                became_unhealthy = true;
            }
        }
    }

    if (became_unhealthy) {
        std::cerr << "[health] Provider " << provider_id << " marked unhealthy after "
                  << failures << " consecutive failures\n";
        ProviderUnhealthyEvent ev;
        ev.provider_id = provider_id;
        ev.consecutive_failures = failures;
        publish_to(event_bus_, ev);
    }
    if (recovered) {
        std::cerr << "[health] Provider " << provider_id << " recovered after success\n";
        ProviderRecoveredEvent ev;
        ev.provider_id = provider_id;
        ev.reason = RecoveryReason::Success;
        publish_to(event_bus_, ev);
    }
}

bool HealthMonitor::is_healthy(const std::string& provider_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(provider_id);
        if (it == records_.end()) return true;

        HealthRecord& rec = it->second;
        if (rec.healthy) return true;

        uint64_t cooldown = static_cast<uint64_t>(policy_.short_recovery.count());
        if (elapsed_since(now_(), rec.last_checked_ms) < cooldown) {
            return false;
        }
        heal(rec);
    }

    std::cerr << "[health] Auto-recovering provider " << provider_id
              << " after cooldown period\n";
    ProviderRecoveredEvent ev;
    ev.provider_id = provider_id;
    ev.reason = RecoveryReason::ShortCooldown;
    publish_to(event_bus_, ev);
    return true;
}

size_t HealthMonitor::sweep_long_recovery(uint64_t now_ms) {
    uint64_t cooldown = static_cast<uint64_t>(policy_.long_recovery.count());
    std::vector<std::string> recovered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, rec] : records_) {
            if (!rec.healthy && elapsed_since(now_ms, rec.last_checked_ms) >= cooldown) {
                heal(rec);
                recovered.push_back(id);
            }
        }
    }

    std::sort(recovered.begin(), recovered.end());
    for (const auto& id : recovered) {
        std::cerr << "[health] Auto-recovering provider " << id
                  << " after extended downtime\n";
        ProviderRecoveredEvent ev;
        ev.provider_id = id;
        ev.reason = RecoveryReason::LongSweep;
        publish_to(event_bus_, ev);
    }
    return recovered.size();
}

void HealthMonitor::touch(const std::string& provider_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    get_or_create(provider_id);
}

std::optional<HealthRecord> HealthMonitor::record(const std::string& provider_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(provider_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<HealthRecord> HealthMonitor::snapshot() const {
    std::vector<HealthRecord> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(records_.size());
        for (const auto& [id, rec] : records_) {
            result.push_back(rec);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const HealthRecord& a, const HealthRecord& b) {
                  return a.provider_id < b.provider_id;
              });
    return result;
}

size_t HealthMonitor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace routekeeper
