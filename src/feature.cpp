#include "feature.hpp"
#include "errors.hpp"
#include <algorithm>

namespace routekeeper {

std::vector<std::string> FeatureConfigPatch::referenced_providers() const {
    std::vector<std::string> ids;
    if (primary) ids.push_back(*primary);
    if (fallbacks) ids.insert(ids.end(), fallbacks->begin(), fallbacks->end());
    return ids;
}

static void apply_patch(FeatureConfig& config, const FeatureConfigPatch& patch) {
    if (patch.primary) config.primary = *patch.primary;
    if (patch.fallbacks) config.fallbacks = *patch.fallbacks;
    if (patch.max_retries) config.max_retries = *patch.max_retries;
    if (patch.clear_cost_ceiling) config.cost_ceiling.reset();
    if (patch.cost_ceiling) config.cost_ceiling = *patch.cost_ceiling;
    if (patch.capability) config.capability = *patch.capability;
}

FeatureTable::FeatureTable(std::vector<FeatureConfig> features, bool allow_create)
    : allow_create_(allow_create) {
    for (auto& f : features) {
        if (f.name.empty()) {
            throw ConfigError("feature with empty name");
        }
        std::string name = f.name;
        if (!features_.emplace(name, std::move(f)).second) {
            throw ConfigError("duplicate feature: " + name);
        }
    }
}

FeatureConfig FeatureTable::get(const std::string& feature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = features_.find(feature);
    if (it == features_.end()) {
        throw ConfigError("unknown feature: " + feature);
    }
    return it->second;
}

bool FeatureTable::contains(const std::string& feature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return features_.count(feature) > 0;
}

FeatureConfig FeatureTable::update(const std::string& feature,
                                   const FeatureConfigPatch& patch) {
    if (patch.primary && patch.primary->empty()) {
        throw ConfigError("feature " + feature + ": primary must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = features_.find(feature);
    if (it == features_.end()) {
        if (!allow_create_) {
            throw ConfigError("unknown feature: " + feature);
        }
        if (!patch.primary) {
            throw ConfigError("new feature " + feature + " requires a primary provider");
        }
        FeatureConfig created;
        created.name = feature;
        apply_patch(created, patch);
        auto [inserted, _] = features_.emplace(feature, std::move(created));
        return inserted->second;
    }

    apply_patch(it->second, patch);
    return it->second;
}

void FeatureTable::define(FeatureConfig config) {
    if (config.name.empty()) {
        throw ConfigError("feature with empty name");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = config.name;
    features_[name] = std::move(config);
}

std::vector<std::string> FeatureTable::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(features_.size());
        for (const auto& [name, _] : features_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t FeatureTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return features_.size();
}

} // namespace routekeeper
