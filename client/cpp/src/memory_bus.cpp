#include "lattice/memory_bus.hpp"

#include <utility>
#include <vector>
#include "lattice/subjects.hpp"

namespace lattice {

MemoryBus::~MemoryBus() {
    set_connected(false);
}

void MemoryBus::publish(const std::string& topic, const std::string& payload) {
    if (!connected_.load()) {
        throw TransportError("bus is not connected");
    }
    if (payload.size() > max_payload_bytes_) {
        throw TransportError("payload of " + std::to_string(payload.size()) +
                             " bytes exceeds the maximum of " + std::to_string(max_payload_bytes_));
    }
    if (topic.empty()) {
        throw TransportError("cannot publish to an empty subject");
    }

    RawMessage message{topic, payload, std::chrono::steady_clock::now()};
    std::vector<std::shared_ptr<Handler>> matched_handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, subscription] : subscriptions_) {
            if (subjects::matches(subscription->pattern(), topic)) {
                subscription->deliver(message);
            }
        }
        for (auto& [id, entry] : handlers_) {
            if (subjects::matches(entry.pattern, topic)) {
                matched_handlers.push_back(entry.handler);
            }
        }
    }
    ++published_;

    for (auto& handler : matched_handlers) {
        (*handler)(message);
    }
}

std::unique_ptr<Subscription> MemoryBus::subscribe_ephemeral(const std::string& pattern) {
    if (!connected_.load()) {
        throw TransportError("bus is not connected");
    }
    if (pattern.empty()) {
        throw TransportError("cannot subscribe to an empty subject");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto id = ++next_id_;
    auto subscription = std::make_unique<QueuedSubscription>(pattern, [this, id] { unregister(id); });
    subscriptions_.emplace(id, subscription.get());
    return subscription;
}

MemoryBus::HandlerId MemoryBus::add_handler(const std::string& pattern, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = ++next_id_;
    handlers_.emplace(id, HandlerEntry{pattern, std::make_shared<Handler>(std::move(handler))});
    return id;
}

void MemoryBus::remove_handler(HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

void MemoryBus::set_connected(bool connected) {
    connected_.store(connected);
    if (connected) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, subscription] : subscriptions_) {
        subscription->detach();
    }
    subscriptions_.clear();
}

std::size_t MemoryBus::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void MemoryBus::unregister(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(id);
}

} // namespace lattice
