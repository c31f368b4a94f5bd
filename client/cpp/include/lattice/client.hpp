#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "transport.hpp"
#include "types.hpp"
#include "watcher.hpp"

namespace lattice {

/**
 * Everything needed to run one scatter-gather query.
 */
struct QueryOptions {
    InventoryKind kind = InventoryKind::Hosts;
    Scope scope;

    /**
     * Collection window; the client's default timeout when unset.
     */
    std::optional<std::chrono::milliseconds> timeout;

    /**
     * Early-stop hint: finish once this many distinct hosts replied.
     */
    std::optional<std::size_t> expected_replies;

    /**
     * Fewer replies than this raise QueryError (Insufficient).
     */
    std::size_t min_replies = 0;

    /**
     * Generated when unset.
     */
    std::optional<std::string> correlation_id;

    std::optional<CancellationToken> cancellation;

    // Launch auctions only.
    std::optional<uint32_t> revision;
    std::map<std::string, std::string> constraints;
};

/**
 * Client for discovering and querying a lattice.
 *
 * Every query broadcasts a request and aggregates whatever replies arrive
 * within the timeout. The lattice has no registry, so a snapshot is best
 * effort: a slow or partitioned host may be missing. A query that times out
 * with no replies returns an empty snapshot whose responded flag is false.
 *
 * Queries are independent and may run concurrently from several threads on
 * one client; each uses its own correlation id and reply subject.
 *
 * Example:
 *   auto client = LatticeClient::from_env();
 *   auto snapshot = client->probe_all();
 *   for (const auto& host : snapshot.hosts) {
 *       std::cout << host.host_id << ": " << host.workload_count() << "\n";
 *   }
 */
class LatticeClient {
public:
    /**
     * Connect to a bus gateway.
     *
     * @throws ConnectionError if the credentials file cannot be read
     */
    static std::unique_ptr<LatticeClient> connect(const ClientConfig& config);

    /**
     * Connect using LATTICE_* environment variables.
     */
    static std::unique_ptr<LatticeClient> from_env();

    /**
     * Create a client over an existing transport.
     */
    explicit LatticeClient(std::shared_ptr<Transport> transport, ClientConfig config = {});

    /**
     * Inventory of every host that answers in time.
     */
    AggregatedSnapshot probe_all(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Inventory of one host. Returns as soon as it replies.
     *
     * @throws InvalidArgumentError if host_id is not a valid subject token
     */
    AggregatedSnapshot probe_host(const std::string& host_id,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Link bindings reported by each host.
     */
    AggregatedSnapshot query_links(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Running workloads, optionally narrowed to one host or one workload id.
     */
    AggregatedSnapshot query_workloads(const Scope& scope,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Capability providers running on each host.
     */
    AggregatedSnapshot query_capabilities(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Ids of every host that answers a probe, sorted.
     */
    std::vector<std::string> get_hosts(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Run an arbitrary query.
     *
     * @throws QueryError (Transport) if the bus fails
     * @throws QueryError (Cancelled) if options.cancellation fires
     * @throws QueryError (Insufficient) if fewer than options.min_replies hosts replied
     * @throws InvalidArgumentError for an invalid scope target or timeout
     */
    AggregatedSnapshot execute(const QueryOptions& options);

    /**
     * Ask every host whether it can run an actor; returns the hosts that
     * accepted, sorted.
     */
    std::vector<std::string> run_auction(const std::string& actor_id, uint32_t revision,
                                         const std::map<std::string, std::string>& constraints,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Tell one host to start an actor. Fire-and-forget.
     *
     * @throws TransportError if the command cannot be published
     */
    void launch_actor(const std::string& host_id, const std::string& actor_id, uint32_t revision);

    /**
     * Tell one host to stop an actor. Fire-and-forget.
     *
     * @throws TransportError if the command cannot be published
     */
    void terminate_actor(const std::string& host_id, const std::string& actor_id);

    /**
     * Stream lattice events to a handler until the watcher is stopped.
     *
     * @throws TransportError if the events subscription cannot be opened
     */
    std::unique_ptr<EventWatcher> watch_events(EventWatcher::Handler handler);

    const ClientConfig& config() const { return config_; }

    Transport& transport() { return *transport_; }

private:
    std::shared_ptr<Transport> transport_;
    ClientConfig config_;
};

} // namespace lattice
