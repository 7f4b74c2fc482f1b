#pragma once
#include "provider.hpp"
#include "feature.hpp"
#include "health_monitor.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace routekeeper {

struct SweeperConfig {
    bool enabled = true;
    uint32_t interval_seconds = 300;
};

// Everything the engine needs at startup. The engine itself never reads
// files or the environment; Config::load does.
struct Config {
    std::vector<Provider> providers;
    std::vector<FeatureConfig> features;
    std::optional<std::string> emergency_default;
    bool allow_feature_creation = false;
    HealthPolicy health;
    SweeperConfig sweeper;

    // Built-in catalog and feature chains (used when no file is given)
    static nlohmann::json defaults_json();
    static Config defaults();

    // Parse a JSON document, filling missing sections from defaults_json().
    // Throws ConfigError naming the offending key.
    static Config from_json(const nlohmann::json& j);

    // Load from path (empty = $ROUTEKEEPER_CONFIG, or built-in defaults
    // when that is unset too), then apply environment overrides.
    static Config load(const std::string& path = "");
};

// JSON forms shared by the config loader, status output and the CLI
nlohmann::json provider_to_json(const Provider& p);
nlohmann::json feature_to_json(const FeatureConfig& f);
Provider provider_from_json(const nlohmann::json& j);
FeatureConfig feature_from_json(const std::string& name, const nlohmann::json& j);

// Parse a patch object ({"primary": ..., "cost_ceiling": null, ...}).
// A null cost_ceiling clears the ceiling.
FeatureConfigPatch patch_from_json(const nlohmann::json& j);

} // namespace routekeeper
