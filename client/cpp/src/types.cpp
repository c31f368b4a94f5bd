#include "lattice/types.hpp"

#include <algorithm>

namespace lattice {

const char* to_string(InventoryKind kind) {
    switch (kind) {
        case InventoryKind::Hosts: return "hosts";
        case InventoryKind::Workloads: return "workloads";
        case InventoryKind::Links: return "links";
        case InventoryKind::Capabilities: return "capabilities";
        case InventoryKind::Auction: return "auction";
    }
    return "unknown";
}

std::optional<InventoryKind> parse_inventory_kind(const std::string& name) {
    if (name == "hosts") return InventoryKind::Hosts;
    if (name == "workloads") return InventoryKind::Workloads;
    if (name == "links") return InventoryKind::Links;
    if (name == "capabilities") return InventoryKind::Capabilities;
    if (name == "auction") return InventoryKind::Auction;
    return std::nullopt;
}

const HostInventory* AggregatedSnapshot::find(const ResponderIdentity& host_id) const {
    // hosts is sorted by host_id
    auto it = std::lower_bound(hosts.begin(), hosts.end(), host_id,
                               [](const HostInventory& host, const ResponderIdentity& id) {
                                   return host.host_id < id;
                               });
    if (it == hosts.end() || it->host_id != host_id) {
        return nullptr;
    }
    return &*it;
}

std::vector<ResponderIdentity> AggregatedSnapshot::host_ids() const {
    std::vector<ResponderIdentity> ids;
    ids.reserve(hosts.size());
    for (const auto& host : hosts) {
        ids.push_back(host.host_id);
    }
    return ids;
}

} // namespace lattice
