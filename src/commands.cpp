#include "commands.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <sstream>
#include <iomanip>

namespace routekeeper {

// Whole-string decimal parse; rejects trailing garbage like "0.5x".
static std::optional<double> parse_number(const std::string& s) {
    try {
        size_t pos = 0;
        double value = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string cmd_select(RoutingEngine& engine, const std::string& feature) {
    RoutingDecision d = engine.route(feature);
    std::string result = feature + " -> " + d.provider_id + " ("
        + route_source_to_string(d.source);
    if (d.source == RouteSource::Fallback) {
        result += " #" + std::to_string(d.fallback_index + 1);
    }
    return result + ")";
}

std::string cmd_candidates(RoutingEngine& engine, const std::string& feature) {
    auto ids = engine.candidates(feature);
    if (ids.empty()) return "No eligible providers for " + feature;

    uint32_t max_retries = engine.get_feature_config(feature).max_retries;
    std::string result = "Candidates for " + feature + " (max retries "
        + std::to_string(max_retries) + "):\n";
    for (size_t i = 0; i < ids.size(); ++i) {
        result += "  " + std::to_string(i + 1) + ". " + ids[i] + "\n";
    }
    return result;
}

std::string cmd_status(const RoutingEngine& engine) {
    SystemStatus s = engine.system_status();
    std::ostringstream out;
    out << "Providers: " << s.total_providers
        << " (healthy " << s.healthy_count
        << ", unhealthy " << s.unhealthy_count << ")\n";
    out << "By category:\n";
    for (const auto& [name, count] : s.by_category) {
        out << "  " << std::left << std::setw(18) << name << count << "\n";
    }
    out << "By cost:\n";
    for (const auto& [name, count] : s.by_cost_bucket) {
        out << "  " << std::left << std::setw(18) << name << count << "\n";
    }
    out << "By vendor:\n";
    for (const auto& [name, count] : s.by_vendor) {
        out << "  " << std::left << std::setw(18) << name << count << "\n";
    }
    return out.str();
}

std::string cmd_features(const RoutingEngine& engine) {
    const FeatureTable& table = engine.features();
    std::string result;
    for (const auto& name : table.names()) {
        FeatureConfig f = table.get(name);
        result += name + " -> " + f.primary;
        if (!f.fallbacks.empty()) {
            result += " (+" + std::to_string(f.fallbacks.size()) + " fallback";
            result += f.fallbacks.size() == 1 ? ")" : "s)";
        }
        result += "\n";
    }
    return result.empty() ? "No features configured" : result;
}

std::string cmd_feature(const RoutingEngine& engine, const std::string& feature) {
    return feature_to_json(engine.get_feature_config(feature)).dump(2);
}

std::string cmd_report(RoutingEngine& engine, const std::string& args) {
    auto words = split_words(args);
    if (words.size() < 2 || words.size() > 3) {
        return "Usage: /report <provider> ok|fail [latency_ms]";
    }

    bool success;
    if (words[1] == "ok") {
        success = true;
    } else if (words[1] == "fail") {
        success = false;
    } else {
        return "Outcome must be ok or fail, got: " + words[1];
    }

    std::optional<double> latency;
    if (words.size() == 3) {
        latency = parse_number(words[2]);
        if (!latency || *latency < 0.0) {
            return "Invalid latency: " + words[2];
        }
    }

    engine.report(words[0], success, latency);
    auto rec = engine.health_monitor().record(words[0]);
    std::string result = "Recorded " + words[1] + " for " + words[0];
    if (rec) {
        result += rec->healthy ? " (healthy" : " (unhealthy";
        result += ", " + std::to_string(rec->consecutive_failures) + " consecutive failures)";
    }
    return result;
}

std::string cmd_set(RoutingEngine& engine, const std::string& args) {
    auto words = split_words(args);
    if (words.size() < 2) {
        return "Usage: /set <feature> key=value...";
    }

    FeatureConfigPatch patch;
    for (size_t i = 1; i < words.size(); ++i) {
        auto eq = words[i].find('=');
        if (eq == std::string::npos) {
            return "Expected key=value, got: " + words[i];
        }
        std::string key = words[i].substr(0, eq);
        std::string value = words[i].substr(eq + 1);

        if (key == "primary") {
            patch.primary = value;
        } else if (key == "fallbacks") {
            std::vector<std::string> ids;
            for (const auto& id : split(value, ',')) {
                std::string t = trim(id);
                if (!t.empty()) ids.push_back(t);
            }
            patch.fallbacks = ids;
        } else if (key == "max_retries") {
            auto n = parse_uint32(value);
            if (!n) return "Invalid max_retries: " + value;
            patch.max_retries = *n;
        } else if (key == "cost_ceiling") {
            if (value == "none") {
                patch.clear_cost_ceiling = true;
            } else {
                patch.cost_ceiling = parse_number(value);
                if (!patch.cost_ceiling || *patch.cost_ceiling < 0.0) {
                    return "Invalid cost_ceiling: " + value;
                }
            }
        } else if (key == "capability") {
            patch.capability = parse_capability(value);
        } else {
            return "Unknown key: " + key;
        }
    }

    FeatureConfig updated = engine.update_feature_config(words[0], patch);
    return "Updated " + words[0] + ":\n" + feature_to_json(updated).dump(2);
}

std::string cmd_enable(RoutingEngine& engine, const std::string& provider, bool active) {
    engine.set_provider_active(provider, active);
    return std::string("Provider ") + provider + (active ? " enabled" : " disabled");
}

std::string cmd_sweep(RoutingEngine& engine) {
    auto recovered = engine.sweeper().run_once();
    if (!recovered) return "Sweep already in progress, skipped";
    return "Sweep recovered " + std::to_string(*recovered) + " provider(s)";
}

std::string cmd_help() {
    return "Commands:\n"
           "  /select F               Pick a provider for feature F\n"
           "  /candidates F           List eligible providers for F in order\n"
           "  /report ID ok|fail [MS] Report a provider call outcome\n"
           "  /status                 Show health and catalog summary\n"
           "  /features               List features and their primaries\n"
           "  /feature F              Show the routing config of F\n"
           "  /set F key=value...     Update routing (primary, fallbacks,\n"
           "                          max_retries, cost_ceiling, capability)\n"
           "  /enable ID, /disable ID Toggle a provider administratively\n"
           "  /sweep                  Run one long-recovery sweep now\n"
           "  /quit                   Exit\n"
           "  /help                   Show this help\n";
}

std::string handle_command(RoutingEngine& engine, const std::string& line) {
    std::string trimmed = trim(line);
    auto space = trimmed.find(' ');
    std::string cmd = trimmed.substr(0, space);
    std::string args = space == std::string::npos ? "" : trim(trimmed.substr(space + 1));

    try {
        if (cmd == "/select" && !args.empty()) return cmd_select(engine, args);
        if (cmd == "/candidates" && !args.empty()) return cmd_candidates(engine, args);
        if (cmd == "/report") return cmd_report(engine, args);
        if (cmd == "/status") return cmd_status(engine);
        if (cmd == "/features") return cmd_features(engine);
        if (cmd == "/feature" && !args.empty()) return cmd_feature(engine, args);
        if (cmd == "/set") return cmd_set(engine, args);
        if (cmd == "/enable" && !args.empty()) return cmd_enable(engine, args, true);
        if (cmd == "/disable" && !args.empty()) return cmd_enable(engine, args, false);
        if (cmd == "/sweep") return cmd_sweep(engine);
        if (cmd == "/help") return cmd_help();
    } catch (const ConfigError& e) {
        return std::string("Error: ") + e.what();
    } catch (const RoutingExhausted& e) {
        return std::string("Error: ") + e.what();
    }
    return "Unknown command: " + trimmed;
}

} // namespace routekeeper
