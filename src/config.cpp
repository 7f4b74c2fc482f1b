#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace routekeeper {

using json = nlohmann::json;

// ── Field readers ───────────────────────────────────────────────

static std::string read_string(const json& obj, const char* key, const std::string& ctx,
                               const std::string& fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_string()) {
        throw ConfigError(ctx + "." + key + " must be a string");
    }
    return obj[key].get<std::string>();
}

static double read_number(const json& obj, const char* key, const std::string& ctx,
                          double fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_number()) {
        throw ConfigError(ctx + "." + key + " must be a number");
    }
    return obj[key].get<double>();
}

static uint32_t read_uint(const json& obj, const char* key, const std::string& ctx,
                          uint32_t fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    const json& v = obj[key];
    constexpr uint64_t kMax = std::numeric_limits<uint32_t>::max();
    bool in_range = false;
    if (v.is_number_unsigned()) {
        in_range = v.get<uint64_t>() <= kMax;
    } else if (v.is_number_integer()) {
        int64_t n = v.get<int64_t>();
        in_range = n >= 0 && static_cast<uint64_t>(n) <= kMax;
    }
    if (!in_range) {
        throw ConfigError(ctx + "." + key + " must be an integer in [0, 4294967295]");
    }
    return static_cast<uint32_t>(v.get<uint64_t>());
}

static bool read_bool(const json& obj, const char* key, const std::string& ctx,
                      bool fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_boolean()) {
        throw ConfigError(ctx + "." + key + " must be a boolean");
    }
    return obj[key].get<bool>();
}

static std::vector<std::string> read_string_list(const json& obj, const char* key,
                                                 const std::string& ctx) {
    std::vector<std::string> out;
    if (!obj.contains(key) || obj[key].is_null()) return out;
    if (!obj[key].is_array()) {
        throw ConfigError(ctx + "." + key + " must be an array of strings");
    }
    for (const auto& item : obj[key]) {
        if (!item.is_string()) {
            throw ConfigError(ctx + "." + key + " must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

// ── JSON <-> structs ────────────────────────────────────────────

nlohmann::json provider_to_json(const Provider& p) {
    return {
        {"id", p.id},
        {"name", p.display_name},
        {"vendor", p.vendor},
        {"capability", capability_to_string(p.capability)},
        {"unit_cost", p.unit_cost},
        {"capacity", p.capacity},
        {"priority", p.priority},
        {"active", p.active}
    };
}

nlohmann::json feature_to_json(const FeatureConfig& f) {
    json j = {
        {"primary", f.primary},
        {"fallbacks", f.fallbacks},
        {"max_retries", f.max_retries},
        {"cost_ceiling", nullptr},
        {"capability", nullptr}
    };
    if (f.cost_ceiling) j["cost_ceiling"] = *f.cost_ceiling;
    if (f.capability) j["capability"] = capability_to_string(*f.capability);
    return j;
}

Provider provider_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("providers[] entries must be objects");
    }
    Provider p;
    p.id = read_string(j, "id", "provider", "");
    if (p.id.empty()) {
        throw ConfigError("provider.id is required");
    }
    std::string ctx = "providers." + p.id;
    p.display_name = read_string(j, "name", ctx, p.id);
    p.vendor = read_string(j, "vendor", ctx, "");
    p.capability = parse_capability(read_string(j, "capability", ctx, "text-generation"));
    p.unit_cost = read_number(j, "unit_cost", ctx, 0.0);
    if (p.unit_cost < 0.0) {
        throw ConfigError(ctx + ".unit_cost must not be negative");
    }
    p.capacity = read_uint(j, "capacity", ctx, 0);
    p.priority = read_uint(j, "priority", ctx, 100);
    p.active = read_bool(j, "active", ctx, true);
    return p;
}

FeatureConfig feature_from_json(const std::string& name, const json& j) {
    std::string ctx = "features." + name;
    if (!j.is_object()) {
        throw ConfigError(ctx + " must be an object");
    }
    FeatureConfig f;
    f.name = name;
    f.primary = read_string(j, "primary", ctx, "");
    if (f.primary.empty()) {
        throw ConfigError(ctx + ".primary is required");
    }
    f.fallbacks = read_string_list(j, "fallbacks", ctx);
    f.max_retries = read_uint(j, "max_retries", ctx, kDefaultMaxRetries);
    if (j.contains("cost_ceiling") && !j["cost_ceiling"].is_null()) {
        f.cost_ceiling = read_number(j, "cost_ceiling", ctx, 0.0);
    }
    if (j.contains("capability") && !j["capability"].is_null()) {
        f.capability = parse_capability(read_string(j, "capability", ctx, ""));
    }
    return f;
}

FeatureConfigPatch patch_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("feature update must be an object");
    }
    const std::string ctx = "update";
    FeatureConfigPatch patch;
    if (j.contains("primary")) patch.primary = read_string(j, "primary", ctx, "");
    if (j.contains("fallbacks")) patch.fallbacks = read_string_list(j, "fallbacks", ctx);
    if (j.contains("max_retries")) patch.max_retries = read_uint(j, "max_retries", ctx, kDefaultMaxRetries);
    if (j.contains("cost_ceiling")) {
        if (j["cost_ceiling"].is_null()) {
            patch.clear_cost_ceiling = true;
        } else {
            patch.cost_ceiling = read_number(j, "cost_ceiling", ctx, 0.0);
        }
    }
    if (j.contains("capability") && !j["capability"].is_null()) {
        patch.capability = parse_capability(read_string(j, "capability", ctx, ""));
    }
    return patch;
}

// ── Defaults ────────────────────────────────────────────────────

nlohmann::json Config::defaults_json() {
    auto provider = [](const char* id, const char* name, const char* vendor,
                       const char* capability, double cost, uint32_t capacity,
                       uint32_t priority) {
        return json{
            {"id", id}, {"name", name}, {"vendor", vendor},
            {"capability", capability}, {"unit_cost", cost},
            {"capacity", capacity}, {"priority", priority}, {"active", true}
        };
    };
    auto chain = [](const char* primary, std::vector<std::string> fallbacks,
                    json ceiling, const char* capability) {
        return json{
            {"primary", primary}, {"fallbacks", fallbacks},
            {"max_retries", 3}, {"cost_ceiling", ceiling},
            {"capability", capability}
        };
    };

    return {
        {"providers", json::array({
            provider("deepseek-r1-distill-llama-70b", "DeepSeek R1 Distill (Llama 70B)", "groq", "reasoning", 0.0, 8192, 1),
            provider("llama-3.3-70b-versatile", "Llama 3.3 70B Versatile", "groq", "text-generation", 0.0, 32768, 2),
            provider("llama3-groq-70b-8192-tool-use-preview", "Llama 3 Groq 70B Tool Use", "groq", "coding", 0.0, 8192, 1),
            provider("llama-3.1-70b-versatile", "Llama 3.1 70B Versatile", "groq", "text-generation", 0.0, 131072, 3),
            provider("mixtral-8x7b-32768", "Mixtral 8x7B", "groq", "creative", 0.0, 32768, 2),
            provider("llama3-8b-8192", "Llama 3 8B", "groq", "text-generation", 0.0, 8192, 4),
            provider("gemma2-9b-it", "Gemma 2 9B", "groq", "translation", 0.0, 8192, 1),
            provider("llama-3.2-1b-preview", "Llama 3.2 1B Preview", "groq", "text-generation", 0.0, 8192, 10),
            provider("deepseek/deepseek-chat", "DeepSeek Chat", "openrouter", "text-generation", 0.14, 65536, 50),
            provider("elevenlabs-tts", "ElevenLabs Multilingual v2", "elevenlabs", "speech-synthesis", 0.30, 5000, 1),
            provider("openai-tts", "OpenAI TTS-1", "openai", "speech-synthesis", 0.015, 4096, 2),
            provider("builtin-speech", "Built-in Speech Synthesis", "local", "speech-synthesis", 0.0, 0, 3)
        })},
        {"features", {
            {"coding_academy", chain("llama3-groq-70b-8192-tool-use-preview",
                {"llama-3.3-70b-versatile", "llama-3.1-70b-versatile", "llama3-8b-8192"}, 0.0, "coding")},
            {"ai_academy", chain("deepseek-r1-distill-llama-70b",
                {"llama-3.3-70b-versatile", "llama-3.1-70b-versatile", "mixtral-8x7b-32768"}, 0.0, "reasoning")},
            {"creative_studio", chain("mixtral-8x7b-32768",
                {"llama-3.3-70b-versatile", "llama-3.1-70b-versatile", "llama3-8b-8192"}, 0.0, "creative")},
            {"translator", chain("gemma2-9b-it",
                {"llama-3.3-70b-versatile", "mixtral-8x7b-32768", "llama3-8b-8192"}, 0.0, "translation")},
            {"robotics", chain("deepseek-r1-distill-llama-70b",
                {"llama3-groq-70b-8192-tool-use-preview", "llama-3.3-70b-versatile", "llama-3.1-70b-versatile"}, 0.0, "reasoning")},
            {"grammar_checker", chain("llama-3.3-70b-versatile",
                {"mixtral-8x7b-32768", "gemma2-9b-it", "llama3-8b-8192"}, 0.0, "text-generation")},
            {"general_chat", chain("deepseek-r1-distill-llama-70b",
                {"llama-3.3-70b-versatile", "llama-3.1-70b-versatile", "mixtral-8x7b-32768"}, 0.0, "text-generation")},
            {"narration", chain("elevenlabs-tts",
                {"openai-tts", "builtin-speech"}, nullptr, "speech-synthesis")}
        }},
        {"emergency_default", "deepseek/deepseek-chat"},
        {"allow_feature_creation", false},
        {"health", {
            {"failure_threshold", 3},
            {"short_recovery_seconds", 600},
            {"long_recovery_seconds", 1800},
            {"latency_smoothing", 0.5}
        }},
        {"sweeper", {
            {"enabled", true},
            {"interval_seconds", 300}
        }}
    };
}

Config Config::defaults() {
    return from_json(json::object());
}

// Top-level keys and the health/sweeper sections are merged key by key.
// Feature chains are merged by name only, and the default chains are
// dropped entirely when the document brings its own provider list (they
// would reference providers that may not exist).
static json merge_defaults(const json& existing, const json& defaults) {
    json merged = existing;
    bool own_catalog = existing.contains("providers");
    for (auto& [key, value] : defaults.items()) {
        if (own_catalog && (key == "features" || key == "emergency_default")) {
            if (!merged.contains(key)) merged[key] = key == "features" ? json::object() : json();
            continue;
        }
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            for (auto& [sub, sub_value] : value.items()) {
                if (!merged[key].contains(sub)) merged[key][sub] = sub_value;
            }
        }
    }
    return merged;
}

Config Config::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }
    json j = merge_defaults(doc, defaults_json());
    Config cfg;

    if (!j["providers"].is_array()) {
        throw ConfigError("providers must be an array");
    }
    for (const auto& p : j["providers"]) {
        cfg.providers.push_back(provider_from_json(p));
    }

    if (!j["features"].is_object()) {
        throw ConfigError("features must be an object");
    }
    for (auto& [name, obj] : j["features"].items()) {
        cfg.features.push_back(feature_from_json(name, obj));
    }

    std::string emergency = read_string(j, "emergency_default", "config", "");
    if (!emergency.empty()) cfg.emergency_default = emergency;
    cfg.allow_feature_creation = read_bool(j, "allow_feature_creation", "config", false);

    const json& h = j["health"];
    if (!h.is_object()) throw ConfigError("health must be an object");
    cfg.health.failure_threshold = read_uint(h, "failure_threshold", "health", 3);
    cfg.health.short_recovery = std::chrono::seconds(
        read_uint(h, "short_recovery_seconds", "health", 600));
    cfg.health.long_recovery = std::chrono::seconds(
        read_uint(h, "long_recovery_seconds", "health", 1800));
    cfg.health.latency_smoothing = read_number(h, "latency_smoothing", "health", 0.5);
    if (cfg.health.failure_threshold == 0) {
        throw ConfigError("health.failure_threshold must be at least 1");
    }
    if (cfg.health.latency_smoothing <= 0.0 || cfg.health.latency_smoothing > 1.0) {
        throw ConfigError("health.latency_smoothing must be in (0, 1]");
    }

    const json& s = j["sweeper"];
    if (!s.is_object()) throw ConfigError("sweeper must be an object");
    cfg.sweeper.enabled = read_bool(s, "enabled", "sweeper", true);
    cfg.sweeper.interval_seconds = read_uint(s, "interval_seconds", "sweeper", 300);
    if (cfg.sweeper.interval_seconds == 0) {
        throw ConfigError("sweeper.interval_seconds must be positive");
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path;
    if (config_path.empty()) {
        if (const char* v = std::getenv("ROUTEKEEPER_CONFIG")) config_path = v;
    }

    Config cfg;
    if (config_path.empty()) {
        cfg = defaults();
    } else {
        config_path = expand_home(config_path);
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("cannot open config file: " + config_path);
        }
        json j;
        try {
            j = json::parse(file);
        } catch (const json::parse_error& e) {
            throw ConfigError("malformed config file " + config_path + ": " + e.what());
        }
        cfg = from_json(j);
        std::cerr << "[config] Loaded " << cfg.providers.size() << " providers and "
                  << cfg.features.size() << " features from " << config_path << "\n";
    }

    // Environment variables always override the file
    if (const char* v = std::getenv("ROUTEKEEPER_SWEEP_INTERVAL")) {
        auto secs = parse_uint32(v);
        if (!secs || *secs == 0) {
            throw ConfigError(std::string("ROUTEKEEPER_SWEEP_INTERVAL must be a positive integer, got: ") + v);
        }
        cfg.sweeper.interval_seconds = *secs;
    }

    return cfg;
}

} // namespace routekeeper
