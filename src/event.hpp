#pragma once
#include <string>
#include <cstdint>

namespace routekeeper {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ProviderUnhealthy = "ProviderUnhealthy";
    constexpr const char* ProviderRecovered = "ProviderRecovered";
    constexpr const char* FallbackSelected  = "FallbackSelected";
    constexpr const char* EmergencySelected = "EmergencySelected";
    constexpr const char* RoutingExhausted  = "RoutingExhausted";
    constexpr const char* SweepCompleted    = "SweepCompleted";
} // namespace event_tags

enum class RecoveryReason { Success, ShortCooldown, LongSweep };

inline const char* recovery_reason_to_string(RecoveryReason reason) {
    switch (reason) {
        case RecoveryReason::Success: return "success";
        case RecoveryReason::ShortCooldown: return "short_cooldown";
        case RecoveryReason::LongSweep: return "long_sweep";
    }
    return "success";
}

// ── Event structs ───────────────────────────────────────────────

struct ProviderUnhealthyEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderUnhealthy;
    std::string provider_id;
    uint32_t consecutive_failures = 0;

    ProviderUnhealthyEvent() { type_tag = TAG; }
};

struct ProviderRecoveredEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderRecovered;
    std::string provider_id;
    RecoveryReason reason = RecoveryReason::Success;

    ProviderRecoveredEvent() { type_tag = TAG; }
};

struct FallbackSelectedEvent : Event {
    static constexpr const char* TAG = event_tags::FallbackSelected;
    std::string feature;
    std::string provider_id;
    size_t fallback_index = 0;

    FallbackSelectedEvent() { type_tag = TAG; }
};

struct EmergencySelectedEvent : Event {
    static constexpr const char* TAG = event_tags::EmergencySelected;
    std::string feature;
    std::string provider_id;

    EmergencySelectedEvent() { type_tag = TAG; }
};

struct RoutingExhaustedEvent : Event {
    static constexpr const char* TAG = event_tags::RoutingExhausted;
    std::string feature;

    RoutingExhaustedEvent() { type_tag = TAG; }
};

struct SweepCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::SweepCompleted;
    size_t recovered = 0;

    SweepCompletedEvent() { type_tag = TAG; }
};

} // namespace routekeeper
