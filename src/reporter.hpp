#pragma once
#include <string>
#include <optional>

namespace routekeeper {

class HealthMonitor; // forward declaration

// Callback surface for whoever just called a provider. Individual provider
// failures are expected; they only influence future routing.
class OutcomeReporter {
public:
    virtual ~OutcomeReporter() = default;

    virtual void report(const std::string& provider_id, bool success,
                        std::optional<double> latency_ms = std::nullopt) = 0;
};

// Forwards every outcome to HealthMonitor::record_outcome.
class HealthOutcomeReporter : public OutcomeReporter {
public:
    explicit HealthOutcomeReporter(HealthMonitor& health) : health_(health) {}

    void report(const std::string& provider_id, bool success,
                std::optional<double> latency_ms = std::nullopt) override;

private:
    HealthMonitor& health_;
};

} // namespace routekeeper
