#pragma once

#include <string>
#include "types.hpp"

namespace lattice {

/**
 * Subject naming shared by the client and the hosts.
 *
 * All subjects live under "wasmbus", or "wasmbus.<namespace>" when a lattice
 * namespace is configured. Tokens are '.'-separated; '*' matches exactly
 * one token and '>' matches one or more trailing tokens.
 */
namespace subjects {

constexpr const char* ROOT = "wasmbus";
constexpr const char* INBOX_PREFIX = "_INBOX";
constexpr const char* INVENTORY = "inventory";
constexpr const char* CONTROL = "control";
constexpr const char* EVENTS = "events";
constexpr const char* AUCTION_REQUEST = "auction.request";
constexpr const char* LAUNCH_ACTOR = "actor.launch";
constexpr const char* TERMINATE_ACTOR = "actor.terminate";

/**
 * "wasmbus" or "wasmbus.<namespace>".
 */
std::string prefix(const std::string& lattice_namespace);

/**
 * Request subject for an inventory query, e.g.
 * "wasmbus.inventory.workloads.host.N123".
 */
std::string inventory(const std::string& lattice_namespace, InventoryKind kind, const Scope& scope);

std::string auction(const std::string& lattice_namespace);

std::string launch_actor(const std::string& lattice_namespace, const std::string& host_id);

std::string terminate_actor(const std::string& lattice_namespace, const std::string& host_id);

std::string events(const std::string& lattice_namespace);

/**
 * Per-query reply subject, unique as long as the correlation id is.
 */
std::string reply_inbox(const std::string& correlation_id);

/**
 * Request subject for a query, derived from its kind and scope.
 */
std::string request_subject(const std::string& lattice_namespace, const QueryRequest& request);

/**
 * NATS-style subject matching.
 */
bool matches(const std::string& pattern, const std::string& subject);

/**
 * True if the value can be embedded as a single subject token.
 */
bool is_valid_token(const std::string& token);

} // namespace subjects
} // namespace lattice
