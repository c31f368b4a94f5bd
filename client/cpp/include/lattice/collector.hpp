#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include "aggregator.hpp"
#include "cancellation.hpp"
#include "transport.hpp"
#include "types.hpp"

namespace lattice {

enum class CollectorState {
    Idle,
    Publishing,
    Collecting,
    Draining,
    Closed
};

const char* to_string(CollectorState state);

/**
 * Query-specific knobs for a Collector.
 */
struct CollectorOptions {
    /**
     * Subject the request is published on.
     */
    std::string request_subject;

    /**
     * Stop as soon as this many distinct responders have replied.
     */
    std::optional<std::size_t> expected_replies;

    std::optional<CancellationToken> cancellation;
};

/**
 * Replies and accounting produced by one Collector run.
 */
struct CollectionResult {
    ReplySet replies;
    CollectionStats stats;
    bool stopped_early = false;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

/**
 * Drives one scatter-gather query.
 *
 * Idle -> Publishing -> Collecting -> Draining -> Closed
 *
 * The reply subscription is opened before the request is published. While
 * collecting, the Collector waits for whichever comes first: the next reply,
 * the deadline, or cancellation. Undecodable replies and replies for other
 * queries are dropped and counted. A Collector runs once; create a new one
 * per query.
 *
 * Example:
 *   QueryRequest request;
 *   request.correlation_id = helpers::generate_uuid();
 *   request.reply_to = subjects::reply_inbox(request.correlation_id);
 *   Collector collector(bus, request, {"wasmbus.inventory.hosts"});
 *   auto result = collector.run();
 */
class Collector {
public:
    using StateListener = std::function<void(CollectorState)>;

    Collector(Transport& transport, QueryRequest request, CollectorOptions options);

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    /**
     * Run the query to completion.
     *
     * @return Replies collected before the deadline or early stop
     * @throws TransportError if subscribing or publishing fails, or the
     *         reply subscription is lost mid-query
     * @throws QueryError (Cancelled) if the cancellation token fires
     * @throws ClientError if this Collector already ran
     */
    CollectionResult run();

    CollectorState state() const { return state_.load(); }

    const QueryRequest& request() const { return request_; }

    /**
     * Observe state transitions; called on the thread running the query.
     */
    void on_state_change(StateListener listener) { listener_ = std::move(listener); }

private:
    void transition(CollectorState next);

    /**
     * Decode and file one inbound message.
     * Returns true when the expected reply count has been reached.
     */
    bool accept(const RawMessage& message, std::chrono::steady_clock::time_point deadline,
                CollectionResult& result);

    Transport& transport_;
    QueryRequest request_;
    CollectorOptions options_;
    std::atomic<CollectorState> state_{CollectorState::Idle};
    StateListener listener_;
};

} // namespace lattice
