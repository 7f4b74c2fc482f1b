#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace routekeeper {

enum class Capability {
    TextGeneration,
    SpeechSynthesis,
    Translation,
    Reasoning,
    Coding,
    Creative,
    Vision
};

inline const char* capability_to_string(Capability cap) {
    switch (cap) {
        case Capability::TextGeneration: return "text-generation";
        case Capability::SpeechSynthesis: return "speech-synthesis";
        case Capability::Translation: return "translation";
        case Capability::Reasoning: return "reasoning";
        case Capability::Coding: return "coding";
        case Capability::Creative: return "creative";
        case Capability::Vision: return "vision";
    }
    return "text-generation";
}

// Throws ConfigError for unrecognised names.
Capability parse_capability(const std::string& name);

// Static facts about one interchangeable backend.
struct Provider {
    std::string id;
    std::string display_name;
    std::string vendor;          // hosting company, e.g. "groq"
    Capability capability = Capability::TextGeneration;
    double unit_cost = 0.0;      // cost per 1k units (tokens, characters)
    uint32_t capacity = 0;       // max units per request, 0 = unlimited
    uint32_t priority = 100;     // lower = preferred when health is tied
    bool active = true;          // administratively disabled providers are never selected
};

// Read-mostly provider lookup. Only the `active` flag changes after load.
// All methods are thread-safe.
class ProviderCatalog {
public:
    ProviderCatalog() = default;
    explicit ProviderCatalog(std::vector<Provider> providers);

    // Throws ConfigError("unknown provider: <id>")
    Provider get(const std::string& id) const;
    std::optional<Provider> find(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Active providers of one capability, priority ascending (ties by id).
    std::vector<Provider> list_by_category(Capability cap) const;

    // Every provider, sorted by id.
    std::vector<Provider> all() const;
    size_t size() const;

    // Administrative toggle. Throws ConfigError for unknown ids.
    void set_active(const std::string& id, bool active);
    bool is_active(const std::string& id) const;

    // unit_cost * units / 1000; 0 for unknown ids.
    double cost_estimate(const std::string& id, uint32_t units) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Provider> providers_;
};

} // namespace routekeeper
