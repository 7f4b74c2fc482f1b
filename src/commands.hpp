#pragma once
#include <string>

namespace routekeeper {

class RoutingEngine;

// Operator command handlers used by the REPL and one-shot flags in
// main.cpp. Each returns a string result for the caller to print.

std::string cmd_select(RoutingEngine& engine, const std::string& feature);
std::string cmd_candidates(RoutingEngine& engine, const std::string& feature);
std::string cmd_status(const RoutingEngine& engine);
std::string cmd_features(const RoutingEngine& engine);
std::string cmd_feature(const RoutingEngine& engine, const std::string& feature);

// These mutate engine state.
// args: "<provider> ok|fail [latency_ms]"
std::string cmd_report(RoutingEngine& engine, const std::string& args);
// args: "<feature> key=value..." with keys primary, fallbacks (comma
// separated), max_retries, cost_ceiling (number or "none"), capability
std::string cmd_set(RoutingEngine& engine, const std::string& args);
std::string cmd_enable(RoutingEngine& engine, const std::string& provider, bool active);
std::string cmd_sweep(RoutingEngine& engine);

std::string cmd_help();

// Dispatch one "/command args" line. Errors from the engine are rendered
// as "Error: ..." rather than thrown.
std::string handle_command(RoutingEngine& engine, const std::string& line);

} // namespace routekeeper
