#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "config.hpp"
#include "transport.hpp"

namespace lattice {

/**
 * In-process publish/subscribe bus.
 *
 * Delivers every published message to each matching subscription and
 * handler, using NATS subject wildcards. Useful for embedding a lattice in
 * one process and for exercising the query core without a gateway.
 *
 * Handlers run synchronously on the publishing thread and may publish.
 */
class MemoryBus : public Transport {
public:
    using Handler = std::function<void(const RawMessage&)>;
    using HandlerId = uint64_t;

    explicit MemoryBus(std::size_t max_payload_bytes = ClientConfig::DEFAULT_MAX_PAYLOAD)
        : max_payload_bytes_(max_payload_bytes) {}

    ~MemoryBus() override;

    void publish(const std::string& topic, const std::string& payload) override;

    std::unique_ptr<Subscription> subscribe_ephemeral(const std::string& pattern) override;

    /**
     * Register a callback subscriber.
     */
    HandlerId add_handler(const std::string& pattern, Handler handler);

    void remove_handler(HandlerId id);

    /**
     * Simulate losing or regaining the connection. Disconnecting closes
     * every open subscription.
     */
    void set_connected(bool connected);

    bool is_connected() const { return connected_.load(); }

    /**
     * Number of subscriptions currently open.
     */
    std::size_t subscription_count() const;

    std::size_t published_count() const { return published_.load(); }

private:
    struct HandlerEntry {
        std::string pattern;
        std::shared_ptr<Handler> handler;
    };

    void unregister(uint64_t id);

    const std::size_t max_payload_bytes_;
    std::atomic<bool> connected_{true};
    std::atomic<std::size_t> published_{0};

    mutable std::mutex mutex_;
    uint64_t next_id_ = 0;
    std::map<uint64_t, QueuedSubscription*> subscriptions_;
    std::map<HandlerId, HandlerEntry> handlers_;
};

} // namespace lattice
