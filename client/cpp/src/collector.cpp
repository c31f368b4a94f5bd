#include "lattice/collector.hpp"

#include <memory>
#include "lattice/codec.hpp"
#include "lattice/errors.hpp"
#include "lattice/logging.hpp"

namespace lattice {

namespace {

constexpr const char* COMPONENT = "collector";

/**
 * Closes the reply subscription when cancellation fires and unregisters
 * itself on scope exit.
 */
class CancellationLink {
public:
    CancellationLink(std::optional<CancellationToken>& token, const std::shared_ptr<Subscription>& subscription)
        : token_(token) {
        if (!token_) return;
        std::weak_ptr<Subscription> weak = subscription;
        registration_ = token_->on_cancel([weak] {
            if (auto live = weak.lock()) {
                live->close();
            }
        });
    }

    ~CancellationLink() {
        if (token_ && registration_ != 0) {
            token_->remove(registration_);
        }
    }

    bool cancelled() const { return token_ && token_->is_cancelled(); }

private:
    std::optional<CancellationToken>& token_;
    CancellationToken::Registration registration_ = 0;
};

} // anonymous namespace

const char* to_string(CollectorState state) {
    switch (state) {
        case CollectorState::Idle: return "idle";
        case CollectorState::Publishing: return "publishing";
        case CollectorState::Collecting: return "collecting";
        case CollectorState::Draining: return "draining";
        case CollectorState::Closed: return "closed";
    }
    return "unknown";
}

Collector::Collector(Transport& transport, QueryRequest request, CollectorOptions options)
    : transport_(transport), request_(std::move(request)), options_(std::move(options)) {}

void Collector::transition(CollectorState next) {
    state_.store(next);
    if (listener_) {
        listener_(next);
    }
}

CollectionResult Collector::run() {
    CollectorState expected = CollectorState::Idle;
    if (!state_.compare_exchange_strong(expected, CollectorState::Publishing)) {
        throw ClientError("collector already ran; create a new collector per query");
    }
    if (listener_) listener_(CollectorState::Publishing);

    CollectionResult result;
    result.started_at = std::chrono::system_clock::now();

    if (options_.cancellation && options_.cancellation->is_cancelled()) {
        transition(CollectorState::Closed);
        throw QueryError::cancelled();
    }

    std::shared_ptr<Subscription> subscription;
    try {
        subscription = transport_.subscribe_ephemeral(request_.reply_to);
    } catch (const TransportError&) {
        transition(CollectorState::Closed);
        throw;
    }

    CancellationLink cancellation(options_.cancellation, subscription);

    try {
        transport_.publish(options_.request_subject, codec::encode_request(request_));
    } catch (const TransportError& e) {
        subscription->close();
        transition(CollectorState::Closed);
        log_debug(COMPONENT, "publish_failed",
                  {{"correlation_id", request_.correlation_id}, {"error", e.what()}});
        throw;
    }

    const auto deadline = std::chrono::steady_clock::now() + clamp_query_timeout(request_.timeout);
    transition(CollectorState::Collecting);

    while (!cancellation.cancelled()) {
        auto message = subscription->next(deadline);
        if (!message) {
            break;
        }
        if (accept(*message, deadline, result)) {
            result.stopped_early = true;
            break;
        }
    }

    transition(CollectorState::Draining);
    bool lost = subscription->is_closed() && !cancellation.cancelled() && !result.stopped_early &&
                std::chrono::steady_clock::now() < deadline;
    subscription->close();

    if (cancellation.cancelled()) {
        result.replies.clear();
        transition(CollectorState::Closed);
        log_debug(COMPONENT, "query_cancelled", {{"correlation_id", request_.correlation_id}});
        throw QueryError::cancelled();
    }
    if (lost) {
        transition(CollectorState::Closed);
        throw TransportError("reply subscription closed before the query deadline");
    }

    result.finished_at = std::chrono::system_clock::now();
    result.stats.duplicates = result.replies.duplicates();
    transition(CollectorState::Closed);

    log_debug(COMPONENT, "query_complete", {
        {"correlation_id", request_.correlation_id},
        {"kind", to_string(request_.kind)},
        {"responders", result.replies.size()},
        {"received", result.stats.received},
        {"decode_failures", result.stats.decode_failures},
        {"mismatched", result.stats.mismatched},
        {"stopped_early", result.stopped_early}
    });
    return result;
}

bool Collector::accept(const RawMessage& message, std::chrono::steady_clock::time_point deadline,
                       CollectionResult& result) {
    ++result.stats.received;

    if (message.arrived_at > deadline) {
        ++result.stats.late;
        return false;
    }

    auto decoded = codec::decode_reply(message.payload);
    if (!decoded) {
        ++result.stats.decode_failures;
        log_debug(COMPONENT, "reply_dropped", {
            {"correlation_id", request_.correlation_id},
            {"reason", to_string(decoded.error().kind)},
            {"detail", decoded.error().message}
        });
        return false;
    }

    // Replies to a concurrent query that share the bus.
    if (decoded.value().correlation_id != request_.correlation_id ||
        decoded.value().kind != request_.kind) {
        ++result.stats.mismatched;
        return false;
    }

    ++result.stats.accepted;
    result.replies.upsert(decoded.take());

    return options_.expected_replies.has_value() && *options_.expected_replies > 0 &&
           result.replies.size() >= *options_.expected_replies;
}

} // namespace lattice
