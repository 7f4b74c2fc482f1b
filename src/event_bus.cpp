#include "event_bus.hpp"
#include <algorithm>

namespace routekeeper {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(Subscription{id, std::move(handler)});
    tag_of_.emplace(id, tag);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = tag_of_.find(id);
    if (owner == tag_of_.end()) return false;

    auto& subs = by_tag_[owner->second];
    subs.erase(std::remove_if(subs.begin(), subs.end(),
                              [id](const Subscription& s) { return s.id == id; }),
               subs.end());
    if (subs.empty()) by_tag_.erase(owner->second);
    tag_of_.erase(owner);
    return true;
}

size_t EventBus::publish(const Event& event) {
    // Copy the handlers out so they may subscribe, unsubscribe or publish
    // again without deadlocking on mutex_.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published_[event.type_tag]++;
        auto it = by_tag_.find(event.type_tag);
        if (it != by_tag_.end()) {
            for (const auto& sub : it->second) to_call.push_back(sub.handler);
        }
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
    return to_call.size();
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_tag_.clear();
    tag_of_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

uint64_t EventBus::published(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = published_.find(tag);
    return it == published_.end() ? 0 : it->second;
}

std::map<std::string, uint64_t> EventBus::published_counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace routekeeper
