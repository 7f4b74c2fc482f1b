#include "router.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <iostream>

namespace routekeeper {

Router::Router(const FeatureTable& features,
               const ProviderCatalog& catalog,
               HealthMonitor& health,
               std::optional<std::string> emergency_default,
               EventBus* event_bus)
    : features_(features), catalog_(catalog), health_(health),
      emergency_default_(std::move(emergency_default)), event_bus_(event_bus) {
    if (emergency_default_ && emergency_default_->empty()) {
        emergency_default_.reset();
    }
}

bool Router::eligible(const std::string& provider_id, const FeatureConfig& config) {
    // Health first: the lazy recovery rule must run whenever a routing
    // decision touches the provider.
    if (!health_.is_healthy(provider_id)) return false;

    auto provider = catalog_.find(provider_id);
    if (!provider || !provider->active) return false;
    if (config.cost_ceiling && provider->unit_cost > *config.cost_ceiling) return false;
    return true;
}

RoutingDecision Router::route(const std::string& feature) {
    FeatureConfig config = features_.get(feature);

    // Every candidate this decision looks at gets a health record, chosen
    // or not, so status shows the whole chain once a feature is routed.
    auto examine = [&](const std::string& id) {
        health_.touch(id);
        return eligible(id, config);
    };

    RoutingDecision decision;
    if (examine(config.primary)) {
        decision.provider_id = config.primary;
        decision.source = RouteSource::Primary;
        return decision;
    }

    for (size_t i = 0; i < config.fallbacks.size(); ++i) {
        const std::string& id = config.fallbacks[i];
        if (!examine(id)) continue;

        decision.provider_id = id;
        decision.source = RouteSource::Fallback;
        decision.fallback_index = i;

        std::cerr << "[router] Using fallback provider " << id << " for " << feature << "\n";
        FallbackSelectedEvent ev;
        ev.feature = feature;
        ev.provider_id = id;
        ev.fallback_index = i;
        publish_to(event_bus_, ev);
        return decision;
    }

    if (emergency_default_) {
        decision.provider_id = *emergency_default_;
        decision.source = RouteSource::Emergency;
        health_.touch(decision.provider_id);

        std::cerr << "[router] All preferred providers unavailable for " << feature
                  << ", using emergency default " << *emergency_default_ << "\n";
        EmergencySelectedEvent ev;
        ev.feature = feature;
        ev.provider_id = *emergency_default_;
        publish_to(event_bus_, ev);
        return decision;
    }

    std::cerr << "[router] No eligible provider for " << feature << "\n";
    RoutingExhaustedEvent ev;
    ev.feature = feature;
    publish_to(event_bus_, ev);
    throw RoutingExhausted(feature, "no eligible provider for feature: " + feature);
}

std::string Router::select_provider(const std::string& feature) {
    return route(feature).provider_id;
}

std::vector<std::string> Router::candidates(const std::string& feature) {
    FeatureConfig config = features_.get(feature);

    std::vector<std::string> result;
    auto consider = [&](const std::string& id) {
        if (std::find(result.begin(), result.end(), id) != result.end()) return;
        if (eligible(id, config)) result.push_back(id);
    };

    consider(config.primary);
    for (const auto& id : config.fallbacks) {
        consider(id);
    }
    if (emergency_default_ &&
        std::find(result.begin(), result.end(), *emergency_default_) == result.end()) {
        result.push_back(*emergency_default_);
    }
    return result;
}

} // namespace routekeeper
