#include "lattice/client.hpp"

#include <utility>
#include "lattice/aggregator.hpp"
#include "lattice/codec.hpp"
#include "lattice/collector.hpp"
#include "lattice/grpc_transport.hpp"
#include "lattice/helpers.hpp"
#include "lattice/logging.hpp"
#include "lattice/subjects.hpp"
#include "lattice/validation.hpp"

namespace lattice {

namespace {

constexpr const char* COMPONENT = "client";

void validate_scope(const Scope& scope) {
    switch (scope.type) {
        case Scope::Type::All:
            return;
        case Scope::Type::Host:
            validation::require_subject_token(scope.target, "host id");
            return;
        case Scope::Type::Workload:
            validation::require_subject_token(scope.target, "workload id");
            return;
    }
}

} // anonymous namespace

std::unique_ptr<LatticeClient> LatticeClient::connect(const ClientConfig& config) {
    return std::make_unique<LatticeClient>(GrpcTransport::connect(config), config);
}

std::unique_ptr<LatticeClient> LatticeClient::from_env() {
    return connect(ClientConfig::from_env());
}

LatticeClient::LatticeClient(std::shared_ptr<Transport> transport, ClientConfig config)
    : transport_(std::move(transport)), config_(std::move(config)) {
    if (!transport_) {
        throw InvalidArgumentError("transport must not be null");
    }
}

AggregatedSnapshot LatticeClient::probe_all(std::optional<std::chrono::milliseconds> timeout) {
    QueryOptions options;
    options.kind = InventoryKind::Hosts;
    options.timeout = timeout;
    return execute(options);
}

AggregatedSnapshot LatticeClient::probe_host(const std::string& host_id,
                                             std::optional<std::chrono::milliseconds> timeout) {
    QueryOptions options;
    options.kind = InventoryKind::Hosts;
    options.scope = Scope::host(host_id);
    options.timeout = timeout;
    options.expected_replies = 1;
    return execute(options);
}

AggregatedSnapshot LatticeClient::query_links(std::optional<std::chrono::milliseconds> timeout) {
    QueryOptions options;
    options.kind = InventoryKind::Links;
    options.timeout = timeout;
    return execute(options);
}

AggregatedSnapshot LatticeClient::query_workloads(const Scope& scope,
                                                  std::optional<std::chrono::milliseconds> timeout) {
    QueryOptions options;
    options.kind = InventoryKind::Workloads;
    options.scope = scope;
    options.timeout = timeout;
    if (scope.type == Scope::Type::Host) {
        options.expected_replies = 1;
    }
    return execute(options);
}

AggregatedSnapshot LatticeClient::query_capabilities(std::optional<std::chrono::milliseconds> timeout) {
    QueryOptions options;
    options.kind = InventoryKind::Capabilities;
    options.timeout = timeout;
    return execute(options);
}

std::vector<std::string> LatticeClient::get_hosts(std::optional<std::chrono::milliseconds> timeout) {
    return probe_all(timeout).host_ids();
}

AggregatedSnapshot LatticeClient::execute(const QueryOptions& options) {
    validate_scope(options.scope);
    auto timeout = options.timeout.value_or(config_.timeout);
    validation::require_positive(timeout, "timeout");

    QueryRequest request;
    request.kind = options.kind;
    request.scope = options.scope;
    request.correlation_id = options.correlation_id.value_or(helpers::generate_uuid());
    validation::require_subject_token(request.correlation_id, "correlation id");
    request.reply_to = subjects::reply_inbox(request.correlation_id);
    request.timeout = clamp_query_timeout(timeout);
    request.revision = options.revision;
    request.constraints = options.constraints;

    CollectorOptions collector_options;
    collector_options.request_subject = subjects::request_subject(config_.lattice_namespace, request);
    collector_options.expected_replies = options.expected_replies;
    collector_options.cancellation = options.cancellation;

    Collector collector(*transport_, request, collector_options);
    CollectionResult result;
    try {
        result = collector.run();
    } catch (const TransportError& e) {
        log_warn(COMPONENT, "query_failed", {
            {"correlation_id", request.correlation_id},
            {"subject", collector_options.request_subject},
            {"error", e.what()}
        });
        throw QueryError::transport(e, std::current_exception());
    }

    auto snapshot = Aggregator(options.kind).aggregate(result.replies);
    snapshot.started_at = result.started_at;
    snapshot.finished_at = result.finished_at;
    snapshot.stopped_early = result.stopped_early;
    snapshot.stats = result.stats;

    if (snapshot.size() < options.min_replies) {
        auto received = snapshot.size();
        throw QueryError::insufficient(options.min_replies, received,
                                       std::make_shared<const AggregatedSnapshot>(std::move(snapshot)));
    }
    return snapshot;
}

std::vector<std::string> LatticeClient::run_auction(const std::string& actor_id, uint32_t revision,
                                                    const std::map<std::string, std::string>& constraints,
                                                    std::optional<std::chrono::milliseconds> timeout) {
    QueryOptions options;
    options.kind = InventoryKind::Auction;
    options.scope = Scope::workload(actor_id);
    options.timeout = timeout;
    options.revision = revision;
    options.constraints = constraints;
    return execute(options).host_ids();
}

void LatticeClient::launch_actor(const std::string& host_id, const std::string& actor_id,
                                 uint32_t revision) {
    validation::require_subject_token(host_id, "host id");
    validation::require_not_empty(actor_id, "actor id");
    transport_->publish(subjects::launch_actor(config_.lattice_namespace, host_id),
                        codec::encode_launch_command(actor_id, revision));
    log_info(COMPONENT, "launch_requested", {{"host", host_id}, {"actor", actor_id}, {"revision", revision}});
}

void LatticeClient::terminate_actor(const std::string& host_id, const std::string& actor_id) {
    validation::require_subject_token(host_id, "host id");
    validation::require_not_empty(actor_id, "actor id");
    transport_->publish(subjects::terminate_actor(config_.lattice_namespace, host_id),
                        codec::encode_terminate_command(actor_id));
    log_info(COMPONENT, "terminate_requested", {{"host", host_id}, {"actor", actor_id}});
}

std::unique_ptr<EventWatcher> LatticeClient::watch_events(EventWatcher::Handler handler) {
    return std::make_unique<EventWatcher>(*transport_, subjects::events(config_.lattice_namespace),
                                          std::move(handler));
}

} // namespace lattice
