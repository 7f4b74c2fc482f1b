#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace routekeeper {

using EventHandler = std::function<void(const Event&)>;

// Synchronous in-process notification hub. Health transitions and routing
// decisions are published here; subscribers log, count, or alert.
//
// The bus also keeps a running count of every event published per tag,
// whether or not anyone listens, so status output can report how often
// providers failed over without each caller wiring its own counters.
class EventBus {
public:
    // Returns a subscription ID usable with unsubscribe().
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Handlers run on the publishing thread, in registration order, with the
    // bus mutex released. Returns the number of handlers invoked.
    size_t publish(const Event& event);

    // Drops subscriptions. Publish counts are kept.
    void clear();

    size_t subscriber_count(const std::string& tag) const;

    // Events published under tag since construction.
    uint64_t published(const std::string& tag) const;
    std::map<std::string, uint64_t> published_counts() const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> by_tag_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    std::map<std::string, uint64_t> published_;
    uint64_t next_id_ = 1;
};

template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish helper for optional (nullable) buses.
inline void publish_to(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace routekeeper
