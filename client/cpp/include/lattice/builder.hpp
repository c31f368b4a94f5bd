#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include "client.hpp"
#include "errors.hpp"

namespace lattice {

/**
 * Fluent builder for constructing and executing queries.
 *
 * QueryBuilder reduces boilerplate around QueryOptions:
 *
 * - Chain method calls instead of filling a struct field by field
 * - Point queries (for_host) set the early-stop hint automatically
 * - Build incrementally, execute when ready
 *
 * Example:
 *   auto snapshot = QueryBuilder(client.get(), InventoryKind::Workloads)
 *       .for_host("N123")
 *       .with_timeout(std::chrono::milliseconds(250))
 *       .execute();
 */
class QueryBuilder {
public:
    /**
     * Create a query builder.
     *
     * @param client The client to execute with; may be null if only
     *               options() is used
     * @param kind What to ask the lattice about
     */
    explicit QueryBuilder(LatticeClient* client, InventoryKind kind = InventoryKind::Hosts)
        : client_(client) {
        options_.kind = kind;
    }

    explicit QueryBuilder(InventoryKind kind) : QueryBuilder(nullptr, kind) {}

    /**
     * Address every host (the default).
     */
    QueryBuilder& for_all() {
        options_.scope = Scope::all();
        return *this;
    }

    /**
     * Address a single host and stop as soon as it replies.
     *
     * @param host_id The host's identity
     * @return Reference to this builder for chaining
     */
    QueryBuilder& for_host(const std::string& host_id) {
        options_.scope = Scope::host(host_id);
        if (!options_.expected_replies.has_value()) {
            options_.expected_replies = 1;
        }
        return *this;
    }

    /**
     * Address the hosts running a given workload.
     */
    QueryBuilder& for_workload(const std::string& workload_id) {
        options_.scope = Scope::workload(workload_id);
        return *this;
    }

    /**
     * Set how long replies are collected.
     */
    QueryBuilder& with_timeout(std::chrono::milliseconds timeout) {
        options_.timeout = timeout;
        return *this;
    }

    /**
     * Finish early once this many distinct hosts have replied.
     */
    QueryBuilder& expect(std::size_t replies) {
        options_.expected_replies = replies;
        return *this;
    }

    /**
     * Fail with QueryError (Insufficient) if fewer hosts reply.
     */
    QueryBuilder& require_at_least(std::size_t replies) {
        options_.min_replies = replies;
        return *this;
    }

    /**
     * Use a specific correlation id instead of a generated one.
     */
    QueryBuilder& with_correlation_id(const std::string& id) {
        options_.correlation_id = id;
        return *this;
    }

    QueryBuilder& with_cancellation(const CancellationToken& token) {
        options_.cancellation = token;
        return *this;
    }

    /**
     * Auction parameters: actor revision and placement constraints.
     */
    QueryBuilder& with_revision(uint32_t revision) {
        options_.revision = revision;
        return *this;
    }

    QueryBuilder& with_constraint(const std::string& key, const std::string& value) {
        options_.constraints[key] = value;
        return *this;
    }

    /**
     * The options built so far.
     */
    const QueryOptions& options() const { return options_; }

    /**
     * Execute the query.
     *
     * @return The aggregated snapshot
     * @throws InvalidArgumentError if no client was given
     * @throws QueryError if the query fails, is cancelled, or gets too few replies
     */
    AggregatedSnapshot execute() const {
        if (!client_) {
            throw InvalidArgumentError("QueryBuilder has no client to execute with");
        }
        return client_->execute(options_);
    }

private:
    LatticeClient* client_;
    QueryOptions options_;
};

} // namespace lattice
