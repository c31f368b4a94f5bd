#pragma once

#include <cstddef>
#include <map>
#include <vector>
#include "types.hpp"

namespace lattice {

/**
 * Replies accumulated by one query, keyed by responder identity.
 *
 * upsert() implements replace-on-duplicate: a later reply from the same
 * responder overwrites the earlier one in place. This absorbs at-least-once
 * redelivery by the bus; it is a policy of this client, not something the
 * transport promises.
 */
class ReplySet {
public:
    /**
     * Insert or replace. Returns true if the responder was new.
     */
    bool upsert(ReplyRecord record);

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    std::size_t duplicates() const { return duplicates_; }

    bool contains(const ResponderIdentity& responder) const {
        return index_.count(responder) > 0;
    }

    /**
     * Records in first-arrival order of their responder.
     */
    const std::vector<ReplyRecord>& records() const { return records_; }

    void clear() {
        records_.clear();
        index_.clear();
        duplicates_ = 0;
    }

private:
    std::vector<ReplyRecord> records_;
    std::map<ResponderIdentity, std::size_t> index_;
    std::size_t duplicates_ = 0;
};

/**
 * Merges replies into an AggregatedSnapshot.
 *
 * Pure: no I/O, no clock. The same input always produces the same output:
 * one entry per responder (the last record seen for it wins), ordered by
 * responder identity ascending.
 */
class Aggregator {
public:
    explicit Aggregator(InventoryKind kind = InventoryKind::Hosts) : kind_(kind) {}

    /**
     * Aggregate records given in arrival order.
     */
    AggregatedSnapshot aggregate(const std::vector<ReplyRecord>& records) const;

    AggregatedSnapshot aggregate(const ReplySet& replies) const {
        return aggregate(replies.records());
    }

private:
    InventoryKind kind_;
};

} // namespace lattice
