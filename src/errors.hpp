#pragma once
#include <stdexcept>
#include <string>

namespace routekeeper {

// Unknown feature, unknown provider id, or malformed configuration.
// Never retried internally.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Every primary/fallback/emergency candidate for a feature was ineligible.
class RoutingExhausted : public std::runtime_error {
public:
    RoutingExhausted(const std::string& feature, const std::string& what)
        : std::runtime_error(what), feature_(feature) {}

    const std::string& feature() const { return feature_; }

private:
    std::string feature_;
};

} // namespace routekeeper
