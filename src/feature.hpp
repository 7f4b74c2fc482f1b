#pragma once
#include "provider.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace routekeeper {

constexpr uint32_t kDefaultMaxRetries = 3;

// Routing chain for one logical feature ("code-help", "narration", ...).
struct FeatureConfig {
    std::string name;
    std::string primary;
    std::vector<std::string> fallbacks;   // tried in order, may be empty
    uint32_t max_retries = kDefaultMaxRetries;
    std::optional<double> cost_ceiling;   // max unit_cost, unset = no gate
    std::optional<Capability> capability; // kind of provider the chain is built from
};

// Partial update merged into an existing FeatureConfig. Unset fields keep
// their current value.
struct FeatureConfigPatch {
    std::optional<std::string> primary;
    std::optional<std::vector<std::string>> fallbacks;
    std::optional<uint32_t> max_retries;
    std::optional<double> cost_ceiling;
    bool clear_cost_ceiling = false;
    std::optional<Capability> capability;

    // Provider ids referenced by this patch (primary first, then fallbacks).
    std::vector<std::string> referenced_providers() const;
};

// Feature name -> FeatureConfig. Each feature owns its config by value so
// updates never leak between features. All methods are thread-safe.
class FeatureTable {
public:
    FeatureTable() = default;
    explicit FeatureTable(std::vector<FeatureConfig> features, bool allow_create = false);

    // Throws ConfigError("unknown feature: <name>")
    FeatureConfig get(const std::string& feature) const;
    bool contains(const std::string& feature) const;

    // Merge patch into the named feature and return the result. Unknown
    // features throw ConfigError unless creation is allowed, in which case
    // the patch must name a primary.
    FeatureConfig update(const std::string& feature, const FeatureConfigPatch& patch);

    // Insert or replace a whole entry.
    void define(FeatureConfig config);

    std::vector<std::string> names() const;
    size_t size() const;

    bool allow_create() const { return allow_create_; }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FeatureConfig> features_;
    bool allow_create_ = false;
};

} // namespace routekeeper
