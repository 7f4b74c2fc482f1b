#include "reporter.hpp"
#include "health_monitor.hpp"

namespace routekeeper {

void HealthOutcomeReporter::report(const std::string& provider_id, bool success,
                                   std::optional<double> latency_ms) {
    health_.record_outcome(provider_id, success, latency_ms);
}

} // namespace routekeeper
