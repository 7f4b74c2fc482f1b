#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <optional>

namespace routekeeper {

// Source of "now" in epoch milliseconds. Injected so tests can drive time.
using NowFn = std::function<uint64_t()>;

// Unix epoch milliseconds (wall clock)
uint64_t epoch_millis();

// ISO 8601 timestamp for an epoch-millisecond value (UTC, second precision)
std::string format_timestamp(uint64_t epoch_ms);

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_words(const std::string& s);

// Strict decimal parse: digits only, no sign or whitespace, must fit in
// 32 bits. nullopt otherwise.
std::optional<uint32_t> parse_uint32(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace routekeeper
