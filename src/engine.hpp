#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "feature.hpp"
#include "health_monitor.hpp"
#include "provider.hpp"
#include "reporter.hpp"
#include "router.hpp"
#include "sweeper.hpp"
#include "util.hpp"
#include <map>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace routekeeper {

// "free" (0), "low" (< 1), "medium" (< 10), "high"
const char* cost_bucket(double unit_cost);

struct SystemStatus {
    size_t total_providers = 0;
    size_t healthy_count = 0;
    size_t unhealthy_count = 0;
    std::map<std::string, size_t> by_category;
    std::map<std::string, size_t> by_cost_bucket;
    std::map<std::string, size_t> by_vendor;
};

// Composition root: owns the catalog, routing table, health state, router,
// reporter and sweeper. Construct one per process and pass it by reference.
class RoutingEngine {
public:
    // Throws ConfigError if a feature references a provider the catalog
    // does not know.
    explicit RoutingEngine(const Config& config, NowFn now = epoch_millis);
    ~RoutingEngine();

    RoutingEngine(const RoutingEngine&) = delete;
    RoutingEngine& operator=(const RoutingEngine&) = delete;

    // Start/stop the recovery sweeper. Both idempotent.
    void init();
    void shutdown();

    RoutingDecision route(const std::string& feature);
    std::string select_provider(const std::string& feature);
    std::vector<std::string> candidates(const std::string& feature);

    void report(const std::string& provider_id, bool success,
                std::optional<double> latency_ms = std::nullopt);

    FeatureConfig get_feature_config(const std::string& feature) const;
    FeatureConfig update_feature_config(const std::string& feature,
                                        const FeatureConfigPatch& patch);

    void set_provider_active(const std::string& provider_id, bool active);

    SystemStatus system_status() const;
    nlohmann::json status_json() const;

    EventBus& event_bus() { return bus_; }
    ProviderCatalog& catalog() { return catalog_; }
    const FeatureTable& features() const { return features_; }
    HealthMonitor& health_monitor() { return health_; }
    OutcomeReporter& reporter() { return reporter_; }
    RecoverySweeper& sweeper() { return sweeper_; }

private:
    void validate_providers(const std::string& feature,
                            const std::vector<std::string>& ids) const;

    EventBus bus_;
    ProviderCatalog catalog_;
    FeatureTable features_;
    HealthMonitor health_;
    Router router_;
    HealthOutcomeReporter reporter_;
    RecoverySweeper sweeper_;
    bool sweep_enabled_;
};

} // namespace routekeeper
