#include "engine.hpp"
#include "errors.hpp"
#include <iostream>

namespace routekeeper {

const char* cost_bucket(double unit_cost) {
    if (unit_cost <= 0.0) return "free";
    if (unit_cost < 1.0) return "low";
    if (unit_cost < 10.0) return "medium";
    return "high";
}

RoutingEngine::RoutingEngine(const Config& config, NowFn now)
    : catalog_(config.providers),
      features_(config.features, config.allow_feature_creation),
      health_(config.health, now),
      router_(features_, catalog_, health_, config.emergency_default, &bus_),
      reporter_(health_),
      sweeper_(health_, std::chrono::seconds(config.sweeper.interval_seconds), now),
      sweep_enabled_(config.sweeper.enabled) {
    for (const auto& f : config.features) {
        std::vector<std::string> ids{f.primary};
        ids.insert(ids.end(), f.fallbacks.begin(), f.fallbacks.end());
        validate_providers(f.name, ids);
    }
    health_.set_event_bus(&bus_);
    sweeper_.set_event_bus(&bus_);
}

RoutingEngine::~RoutingEngine() {
    shutdown();
}

void RoutingEngine::validate_providers(const std::string& feature,
                                       const std::vector<std::string>& ids) const {
    for (const auto& id : ids) {
        if (!catalog_.contains(id)) {
            throw ConfigError("feature " + feature + " references unknown provider: " + id);
        }
    }
}

void RoutingEngine::init() {
    if (!sweep_enabled_) return;
    sweeper_.start();
}

void RoutingEngine::shutdown() {
    sweeper_.stop();
}

RoutingDecision RoutingEngine::route(const std::string& feature) {
    return router_.route(feature);
}

std::string RoutingEngine::select_provider(const std::string& feature) {
    return router_.select_provider(feature);
}

std::vector<std::string> RoutingEngine::candidates(const std::string& feature) {
    return router_.candidates(feature);
}

void RoutingEngine::report(const std::string& provider_id, bool success,
                           std::optional<double> latency_ms) {
    if (!catalog_.contains(provider_id)) {
        std::cerr << "[engine] Outcome reported for provider not in catalog: "
                  << provider_id << "\n";
    }
    reporter_.report(provider_id, success, latency_ms);
}

FeatureConfig RoutingEngine::get_feature_config(const std::string& feature) const {
    return features_.get(feature);
}

FeatureConfig RoutingEngine::update_feature_config(const std::string& feature,
                                                   const FeatureConfigPatch& patch) {
    validate_providers(feature, patch.referenced_providers());
    FeatureConfig updated = features_.update(feature, patch);
    std::cerr << "[engine] Updated routing for " << feature << ": primary "
              << updated.primary << ", " << updated.fallbacks.size() << " fallback(s)\n";
    return updated;
}

void RoutingEngine::set_provider_active(const std::string& provider_id, bool active) {
    catalog_.set_active(provider_id, active);
    std::cerr << "[engine] Provider " << provider_id
              << (active ? " enabled" : " disabled") << "\n";
}

SystemStatus RoutingEngine::system_status() const {
    SystemStatus status;
    for (const auto& p : catalog_.all()) {
        status.total_providers++;
        auto rec = health_.record(p.id);
        if (!rec || rec->healthy) {
            status.healthy_count++;
        } else {
            status.unhealthy_count++;
        }
        status.by_category[capability_to_string(p.capability)]++;
        status.by_cost_bucket[cost_bucket(p.unit_cost)]++;
        if (!p.vendor.empty()) status.by_vendor[p.vendor]++;
    }
    return status;
}

nlohmann::json RoutingEngine::status_json() const {
    SystemStatus status = system_status();
    nlohmann::json j = {
        {"total_providers", status.total_providers},
        {"healthy", status.healthy_count},
        {"unhealthy", status.unhealthy_count},
        {"by_category", status.by_category},
        {"by_cost_bucket", status.by_cost_bucket},
        {"by_vendor", status.by_vendor},
        {"sweeper", {
            {"running", sweeper_.running()},
            {"interval_seconds", sweeper_.interval().count() / 1000},
            {"sweeps_completed", sweeper_.sweeps_completed()},
            {"ticks_skipped", sweeper_.ticks_skipped()}
        }},
        {"events", bus_.published_counts()}
    };

    nlohmann::json providers = nlohmann::json::array();
    for (const auto& p : catalog_.all()) {
        nlohmann::json entry = {
            {"id", p.id},
            {"active", p.active},
            {"healthy", true},
            {"consecutive_failures", 0}
        };
        if (auto rec = health_.record(p.id)) {
            entry["healthy"] = rec->healthy;
            entry["consecutive_failures"] = rec->consecutive_failures;
            entry["last_checked"] = format_timestamp(rec->last_checked_ms);
            if (rec->latency_samples > 0) {
                entry["average_latency_ms"] = rec->average_latency_ms;
            }
        }
        providers.push_back(std::move(entry));
    }
    j["providers"] = std::move(providers);
    return j;
}

} // namespace routekeeper
