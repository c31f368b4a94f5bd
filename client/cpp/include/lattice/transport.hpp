#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "errors.hpp"

namespace lattice {

/**
 * A message delivered to a subscription.
 */
struct RawMessage {
    std::string topic;
    std::string payload;
    std::chrono::steady_clock::time_point arrived_at;
};

/**
 * A delivery channel opened on the bus.
 *
 * Messages are queued by the transport as they arrive and handed out in
 * arrival order by next(). close() may be called from any thread, any
 * number of times; it wakes a pending next().
 */
class Subscription {
public:
    virtual ~Subscription() = default;

    /**
     * Wait for the next message until the deadline.
     *
     * @return The message, or std::nullopt when the deadline passed or the
     *         subscription was closed
     */
    virtual std::optional<RawMessage> next(std::chrono::steady_clock::time_point deadline) = 0;

    virtual void close() = 0;

    virtual bool is_closed() const = 0;

    virtual const std::string& pattern() const = 0;
};

/**
 * Publish/subscribe capability consumed by the query core.
 *
 * Implementations are shared by concurrent queries and must be thread-safe.
 * No retries happen at this layer.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Fire-and-forget publish.
     *
     * @throws TransportError if the connection is down or the payload is too large
     */
    virtual void publish(const std::string& topic, const std::string& payload) = 0;

    /**
     * Open a transient subscription owned by the caller.
     *
     * The subscription is live on the bus when this returns, so a request
     * published afterwards cannot be answered before it exists.
     *
     * @throws TransportError if the subscription cannot be created
     */
    virtual std::unique_ptr<Subscription> subscribe_ephemeral(const std::string& pattern) = 0;

    /**
     * Open a long-lived subscription, e.g. for event watching.
     */
    virtual std::unique_ptr<Subscription> subscribe(const std::string& pattern) {
        return subscribe_ephemeral(pattern);
    }
};

/**
 * Queue-backed Subscription shared by the transport implementations.
 *
 * The owning transport calls deliver() from its delivery thread. An
 * on_close hook lets the transport release its side of the subscription.
 */
class QueuedSubscription : public Subscription {
public:
    using CloseHook = std::function<void()>;

    explicit QueuedSubscription(std::string pattern, CloseHook on_close = nullptr)
        : pattern_(std::move(pattern)), on_close_(std::move(on_close)) {}

    ~QueuedSubscription() override { close(); }

    /**
     * Enqueue a message. Returns false if the subscription is closed.
     */
    bool deliver(RawMessage message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<RawMessage> next(std::chrono::steady_clock::time_point deadline) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return closed_ || !queue_.empty(); });
        if (closed_ || queue_.empty()) {
            return std::nullopt;
        }
        RawMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    void close() override {
        CloseHook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            queue_.clear();
            hook = std::move(on_close_);
            cv_.notify_all();
        }
        if (hook) hook();
    }

    /**
     * Close without running the close hook. For the owning transport when
     * it tears down its own side of the subscription.
     *
     * Notifies while holding the lock: a woken reader may destroy the
     * subscription as soon as it can take the mutex.
     */
    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        on_close_ = nullptr;
        closed_ = true;
        queue_.clear();
        cv_.notify_all();
    }

    bool is_closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    const std::string& pattern() const override { return pattern_; }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    const std::string pattern_;
    CloseHook on_close_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RawMessage> queue_;
    bool closed_ = false;
};

} // namespace lattice
