#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include "events.hpp"
#include "transport.hpp"

namespace lattice {

/**
 * Streams lattice events to a handler until stopped.
 *
 * The handler runs on the watcher's own thread, one event at a time, in
 * arrival order. Events that cannot be decoded are logged and skipped, and
 * so is an event whose handler throws.
 */
class EventWatcher {
public:
    using Handler = std::function<void(const BusEvent&)>;

    /**
     * Subscribe to the events subject and start delivering.
     *
     * @throws TransportError if the subscription cannot be opened
     */
    EventWatcher(Transport& transport, const std::string& subject, Handler handler);

    ~EventWatcher();

    EventWatcher(const EventWatcher&) = delete;
    EventWatcher& operator=(const EventWatcher&) = delete;

    /**
     * Stop delivering and join the watcher thread. Idempotent; must not be
     * called from the handler.
     */
    void stop();

    /**
     * False once stopped or once the subscription was lost.
     */
    bool running() const { return running_.load(); }

    std::size_t delivered() const { return delivered_.load(); }
    std::size_t dropped() const { return dropped_.load(); }

private:
    void run();

    std::unique_ptr<Subscription> subscription_;
    Handler handler_;
    std::atomic<bool> running_{true};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> dropped_{0};
    std::thread thread_;
};

} // namespace lattice
