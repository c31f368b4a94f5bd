#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lattice {

/**
 * Name of a replying host. Stable within one query only.
 */
using ResponderIdentity = std::string;

using Labels = std::map<std::string, std::string>;

/**
 * What a query asks the lattice about.
 */
enum class InventoryKind {
    Hosts,
    Workloads,
    Links,
    Capabilities,
    Auction
};

/**
 * Wire name of an inventory kind ("hosts", "workloads", ...).
 */
const char* to_string(InventoryKind kind);

/**
 * Parse a wire name; std::nullopt for unknown names.
 */
std::optional<InventoryKind> parse_inventory_kind(const std::string& name);

enum class WorkloadKind {
    Actor,
    CapabilityProvider,
    Other
};

/**
 * A workload running on a host.
 *
 * For WorkloadKind::Other the tag the host sent is kept in kind_tag.
 */
struct WorkloadDescriptor {
    std::string id;
    WorkloadKind kind = WorkloadKind::Actor;
    std::string kind_tag;
    std::optional<uint32_t> revision;
    std::optional<std::string> image_ref;
    std::optional<std::string> name;
    std::optional<std::string> link_name;

    bool operator==(const WorkloadDescriptor& other) const {
        return id == other.id && kind == other.kind && kind_tag == other.kind_tag &&
               revision == other.revision && image_ref == other.image_ref &&
               name == other.name && link_name == other.link_name;
    }
};

/**
 * A link from an actor to a capability provider instance.
 */
struct LinkBinding {
    std::string actor_id;
    std::string provider_id;
    std::string contract_id;
    std::string link_name;
    std::map<std::string, std::string> values;

    bool operator==(const LinkBinding& other) const {
        return actor_id == other.actor_id && provider_id == other.provider_id &&
               contract_id == other.contract_id && link_name == other.link_name &&
               values == other.values;
    }
};

/**
 * Per-host inventory as reported in one reply.
 */
struct HostInventory {
    ResponderIdentity host_id;
    uint64_t uptime_ms = 0;
    Labels labels;
    std::vector<WorkloadDescriptor> workloads;
    std::vector<LinkBinding> links;

    std::size_t workload_count() const { return workloads.size(); }

    std::size_t count(WorkloadKind kind) const {
        std::size_t n = 0;
        for (const auto& workload : workloads) {
            if (workload.kind == kind) ++n;
        }
        return n;
    }
};

/**
 * Which hosts a query is addressed to.
 */
struct Scope {
    enum class Type {
        All,
        Host,
        Workload
    };

    Type type = Type::All;
    std::string target;

    static Scope all() { return Scope{}; }
    static Scope host(const std::string& host_id) { return Scope{Type::Host, host_id}; }
    static Scope workload(const std::string& workload_id) { return Scope{Type::Workload, workload_id}; }

    bool operator==(const Scope& other) const {
        return type == other.type && target == other.target;
    }
};

/**
 * Longest collection window a request carries. The wire field is a
 * 32-bit millisecond count; longer timeouts are clamped to it.
 */
constexpr std::chrono::milliseconds MAX_QUERY_TIMEOUT{std::numeric_limits<uint32_t>::max()};

/**
 * Clamp a timeout to MAX_QUERY_TIMEOUT.
 */
inline std::chrono::milliseconds clamp_query_timeout(std::chrono::milliseconds timeout) {
    return timeout > MAX_QUERY_TIMEOUT ? MAX_QUERY_TIMEOUT : timeout;
}

/**
 * A single outstanding scatter-gather request.
 */
struct QueryRequest {
    InventoryKind kind = InventoryKind::Hosts;
    Scope scope;
    std::string correlation_id;
    std::string reply_to;
    std::chrono::milliseconds timeout{600};

    // Launch auctions only.
    std::optional<uint32_t> revision;
    std::map<std::string, std::string> constraints;
};

/**
 * One decoded reply.
 */
struct ReplyRecord {
    std::string correlation_id;
    ResponderIdentity responder;
    InventoryKind kind = InventoryKind::Hosts;
    HostInventory inventory;
};

/**
 * Per-query message accounting.
 */
struct CollectionStats {
    std::size_t received = 0;
    std::size_t accepted = 0;
    std::size_t duplicates = 0;
    std::size_t decode_failures = 0;
    std::size_t mismatched = 0;
    std::size_t late = 0;
};

/**
 * Aggregated, deterministic view of one query's replies.
 *
 * hosts is sorted ascending by host_id and holds at most one entry per
 * responder. responded is false when nothing arrived in the window.
 */
struct AggregatedSnapshot {
    InventoryKind kind = InventoryKind::Hosts;
    std::vector<HostInventory> hosts;
    bool responded = false;
    bool stopped_early = false;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    std::size_t total_workloads = 0;
    std::size_t total_links = 0;
    std::map<ResponderIdentity, std::size_t> workload_counts;
    CollectionStats stats;

    bool empty() const { return hosts.empty(); }
    std::size_t size() const { return hosts.size(); }

    /**
     * Inventory reported by a host, or nullptr.
     */
    const HostInventory* find(const ResponderIdentity& host_id) const;

    std::vector<ResponderIdentity> host_ids() const;

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
    }
};

} // namespace lattice
