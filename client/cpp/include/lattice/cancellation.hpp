#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace lattice {

/**
 * Caller-side abort signal for in-flight queries.
 *
 * Copies share state. cancel() runs every registered callback once, on the
 * cancelling thread; a callback registered after cancellation runs
 * immediately.
 *
 * Example:
 *   CancellationToken token;
 *   auto future = std::async([&] {
 *       return client->execute(QueryBuilder(InventoryKind::Hosts).with_cancellation(token).options());
 *   });
 *   token.cancel();  // future.get() throws QueryError (Cancelled)
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using Registration = uint64_t;

    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        std::map<Registration, Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled) return;
            state_->cancelled = true;
            callbacks.swap(state_->callbacks);
        }
        for (auto& [id, callback] : callbacks) {
            callback();
        }
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    Registration on_cancel(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled) {
                auto id = ++state_->next_id;
                state_->callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove(Registration registration) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(registration);
    }

private:
    struct State {
        std::mutex mutex;
        bool cancelled = false;
        Registration next_id = 0;
        std::map<Registration, Callback> callbacks;
    };

    std::shared_ptr<State> state_;
};

} // namespace lattice
