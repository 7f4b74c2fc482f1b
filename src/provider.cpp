#include "provider.hpp"
#include "errors.hpp"
#include <algorithm>

namespace routekeeper {

Capability parse_capability(const std::string& name) {
    static const Capability kAll[] = {
        Capability::TextGeneration, Capability::SpeechSynthesis,
        Capability::Translation, Capability::Reasoning, Capability::Coding,
        Capability::Creative, Capability::Vision
    };
    for (Capability cap : kAll) {
        if (name == capability_to_string(cap)) return cap;
    }
    throw ConfigError("unknown capability: " + name);
}

ProviderCatalog::ProviderCatalog(std::vector<Provider> providers) {
    for (auto& p : providers) {
        if (p.id.empty()) {
            throw ConfigError("provider with empty id");
        }
        std::string id = p.id;
        auto [it, inserted] = providers_.emplace(id, std::move(p));
        (void)it;
        if (!inserted) {
            throw ConfigError("duplicate provider: " + id);
        }
    }
}

Provider ProviderCatalog::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(id);
    if (it == providers_.end()) {
        throw ConfigError("unknown provider: " + id);
    }
    return it->second;
}

std::optional<Provider> ProviderCatalog::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(id);
    if (it == providers_.end()) return std::nullopt;
    return it->second;
}

bool ProviderCatalog::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(id) > 0;
}

std::vector<Provider> ProviderCatalog::list_by_category(Capability cap) const {
    std::vector<Provider> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, p] : providers_) {
            if (p.capability == cap && p.active) {
                result.push_back(p);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const Provider& a, const Provider& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.id < b.id;
    });
    return result;
}

std::vector<Provider> ProviderCatalog::all() const {
    std::vector<Provider> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(providers_.size());
        for (const auto& [id, p] : providers_) {
            result.push_back(p);
        }
    }
    std::sort(result.begin(), result.end(), [](const Provider& a, const Provider& b) {
        return a.id < b.id;
    });
    return result;
}

size_t ProviderCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

void ProviderCatalog::set_active(const std::string& id, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(id);
    if (it == providers_.end()) {
        throw ConfigError("unknown provider: " + id);
    }
    it->second.active = active;
}

bool ProviderCatalog::is_active(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(id);
    return it != providers_.end() && it->second.active;
}

double ProviderCatalog::cost_estimate(const std::string& id, uint32_t units) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(id);
    if (it == providers_.end()) return 0.0;
    return it->second.unit_cost * static_cast<double>(units) / 1000.0;
}

} // namespace routekeeper
