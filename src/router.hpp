#pragma once
#include "feature.hpp"
#include "provider.hpp"
#include "health_monitor.hpp"
#include <string>
#include <vector>
#include <optional>

namespace routekeeper {

class EventBus; // forward declaration

enum class RouteSource { Primary, Fallback, Emergency };

inline const char* route_source_to_string(RouteSource source) {
    switch (source) {
        case RouteSource::Primary: return "primary";
        case RouteSource::Fallback: return "fallback";
        case RouteSource::Emergency: return "emergency";
    }
    return "primary";
}

struct RoutingDecision {
    std::string provider_id;
    RouteSource source = RouteSource::Primary;
    size_t fallback_index = 0;  // position in FeatureConfig::fallbacks, Fallback only
};

// Picks one provider for a feature right now.
//
// Candidates are the primary, then fallbacks in configured order; the first
// that is healthy, active and within the feature's cost ceiling wins. Order
// in configuration is the only preference signal. When none qualifies the
// emergency default (if any) is returned ungated, otherwise
// RoutingExhausted is thrown.
class Router {
public:
    Router(const FeatureTable& features,
           const ProviderCatalog& catalog,
           HealthMonitor& health,
           std::optional<std::string> emergency_default = std::nullopt,
           EventBus* event_bus = nullptr);

    // Throws ConfigError for unknown features, RoutingExhausted when no
    // candidate qualifies.
    RoutingDecision route(const std::string& feature);
    std::string select_provider(const std::string& feature);

    // Every currently eligible candidate in preference order, emergency
    // default last, without duplicates. Callers retrying a request walk
    // this list up to FeatureConfig::max_retries entries.
    std::vector<std::string> candidates(const std::string& feature);

    const std::optional<std::string>& emergency_default() const { return emergency_default_; }

private:
    bool eligible(const std::string& provider_id, const FeatureConfig& config);

    const FeatureTable& features_;
    const ProviderCatalog& catalog_;
    HealthMonitor& health_;
    std::optional<std::string> emergency_default_;
    EventBus* event_bus_;
};

} // namespace routekeeper
