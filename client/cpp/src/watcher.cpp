#include "lattice/watcher.hpp"

#include <chrono>
#include <exception>
#include "lattice/logging.hpp"

namespace lattice {

namespace {

constexpr const char* COMPONENT = "watcher";

// How long one wait on the subscription lasts before checking for stop().
constexpr std::chrono::milliseconds POLL_INTERVAL{250};

} // anonymous namespace

EventWatcher::EventWatcher(Transport& transport, const std::string& subject, Handler handler)
    : subscription_(transport.subscribe(subject)), handler_(std::move(handler)) {
    thread_ = std::thread([this] { run(); });
}

EventWatcher::~EventWatcher() {
    stop();
}

void EventWatcher::stop() {
    running_.store(false);
    subscription_->close();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void EventWatcher::run() {
    while (running_.load()) {
        auto message = subscription_->next(std::chrono::steady_clock::now() + POLL_INTERVAL);
        if (!message) {
            if (subscription_->is_closed()) break;
            continue;
        }

        auto envelope = CloudEvent::decode(message->payload);
        if (!envelope) {
            ++dropped_;
            log_warn(COMPONENT, "event_dropped", {
                {"subject", message->topic},
                {"reason", to_string(envelope.error().kind)},
                {"detail", envelope.error().message}
            });
            continue;
        }
        auto event = envelope.value().event();
        if (!event) {
            ++dropped_;
            log_warn(COMPONENT, "event_dropped", {
                {"subject", message->topic},
                {"type", envelope.value().event_type},
                {"reason", to_string(event.error().kind)},
                {"detail", event.error().message}
            });
            continue;
        }

        try {
            handler_(event.value());
            ++delivered_;
        } catch (const std::exception& e) {
            log_error(COMPONENT, "handler_failed", {
                {"type", envelope.value().event_type},
                {"error", e.what()}
            });
        } catch (...) {
            log_error(COMPONENT, "handler_failed", {
                {"type", envelope.value().event_type},
                {"error", "handler threw a non-standard exception"}
            });
        }
    }
    running_.store(false);
}

} // namespace lattice
