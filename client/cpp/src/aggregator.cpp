#include "lattice/aggregator.hpp"

#include <utility>

namespace lattice {

bool ReplySet::upsert(ReplyRecord record) {
    auto it = index_.find(record.responder);
    if (it != index_.end()) {
        records_[it->second] = std::move(record);
        ++duplicates_;
        return false;
    }
    index_.emplace(record.responder, records_.size());
    records_.push_back(std::move(record));
    return true;
}

AggregatedSnapshot Aggregator::aggregate(const std::vector<ReplyRecord>& records) const {
    // std::map keeps responders sorted; assignment keeps the latest record.
    std::map<ResponderIdentity, const ReplyRecord*> latest;
    for (const auto& record : records) {
        latest[record.responder] = &record;
    }

    AggregatedSnapshot snapshot;
    snapshot.kind = kind_;
    snapshot.responded = !latest.empty();
    snapshot.hosts.reserve(latest.size());

    for (const auto& [responder, record] : latest) {
        HostInventory host = record->inventory;
        host.host_id = responder;

        snapshot.total_workloads += host.workloads.size();
        snapshot.total_links += host.links.size();
        snapshot.workload_counts[responder] = host.workloads.size();
        snapshot.hosts.push_back(std::move(host));
    }
    return snapshot;
}

} // namespace lattice
