#include "lattice/codec.hpp"

#include <limits>
#include <stdexcept>
#include "lattice/helpers.hpp"

using nlohmann::json;

namespace lattice {

const char* to_string(DecodeError::Kind kind) {
    switch (kind) {
        case DecodeError::Kind::MalformedEncoding: return "malformed_encoding";
        case DecodeError::Kind::SchemaMismatch: return "schema_mismatch";
        case DecodeError::Kind::CorrelationMissing: return "correlation_missing";
    }
    return "unknown";
}

namespace codec {

namespace {

constexpr const char* KIND_ACTOR = "actor";
constexpr const char* KIND_PROVIDER = "capability-provider";

/**
 * Raised by the field readers below; never escapes a decode_* function.
 */
class SchemaViolation : public std::runtime_error {
public:
    explicit SchemaViolation(const std::string& message) : std::runtime_error(message) {}
};

const json& require_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw SchemaViolation(std::string("missing field '") + key + "'");
    }
    return *it;
}

std::string require_string(const json& object, const char* key) {
    const auto& value = require_field(object, key);
    if (!value.is_string()) {
        throw SchemaViolation(std::string("field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::string optional_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw SchemaViolation(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> maybe_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw SchemaViolation(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

template<typename T>
std::optional<T> maybe_unsigned(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_unsigned() ||
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw SchemaViolation(std::string("field '") + key + "' must be an unsigned integer");
    }
    return static_cast<T>(it->get<uint64_t>());
}

std::map<std::string, std::string> string_map(const json& object, const char* key) {
    std::map<std::string, std::string> result;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return result;
    if (!it->is_object()) {
        throw SchemaViolation(std::string("field '") + key + "' must be an object");
    }
    for (auto& [name, value] : it->items()) {
        if (!value.is_string()) {
            throw SchemaViolation(std::string("values of '") + key + "' must be strings");
        }
        result.emplace(name, value.get<std::string>());
    }
    return result;
}

const json* optional_array(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return nullptr;
    if (!it->is_array()) {
        throw SchemaViolation(std::string("field '") + key + "' must be an array");
    }
    return &*it;
}

WorkloadKind parse_workload_kind(const std::string& tag) {
    if (tag == KIND_ACTOR) return WorkloadKind::Actor;
    if (tag == KIND_PROVIDER) return WorkloadKind::CapabilityProvider;
    return WorkloadKind::Other;
}

std::string workload_kind_tag(const WorkloadDescriptor& workload) {
    switch (workload.kind) {
        case WorkloadKind::Actor: return KIND_ACTOR;
        case WorkloadKind::CapabilityProvider: return KIND_PROVIDER;
        case WorkloadKind::Other: return workload.kind_tag.empty() ? "other" : workload.kind_tag;
    }
    return "other";
}

WorkloadDescriptor parse_workload(const json& object) {
    if (!object.is_object()) {
        throw SchemaViolation("workload entries must be objects");
    }
    WorkloadDescriptor workload;
    workload.id = require_string(object, "id");
    if (workload.id.empty()) {
        throw SchemaViolation("workload id must not be empty");
    }
    std::string tag = optional_string(object, "kind");
    workload.kind = tag.empty() ? WorkloadKind::Actor : parse_workload_kind(tag);
    if (workload.kind == WorkloadKind::Other) {
        workload.kind_tag = tag;
    }
    workload.revision = maybe_unsigned<uint32_t>(object, "revision");
    workload.image_ref = maybe_string(object, "image_ref");
    workload.name = maybe_string(object, "name");
    workload.link_name = maybe_string(object, "link_name");
    return workload;
}

LinkBinding parse_link(const json& object) {
    if (!object.is_object()) {
        throw SchemaViolation("link entries must be objects");
    }
    LinkBinding link;
    link.actor_id = require_string(object, "actor_id");
    link.provider_id = optional_string(object, "provider_id");
    link.contract_id = require_string(object, "contract_id");
    link.link_name = optional_string(object, "link_name");
    if (link.link_name.empty()) {
        link.link_name = "default";
    }
    link.values = string_map(object, "values");
    return link;
}

bool same_link(const LinkBinding& a, const LinkBinding& b) {
    return a.actor_id == b.actor_id && a.contract_id == b.contract_id && a.link_name == b.link_name;
}

HostInventory parse_inventory(const json& object, const std::string& host_id) {
    if (!object.is_object()) {
        throw SchemaViolation("field 'inventory' must be an object");
    }
    HostInventory inventory;
    inventory.host_id = host_id;
    inventory.uptime_ms = maybe_unsigned<uint64_t>(object, "uptime_ms").value_or(0);
    inventory.labels = string_map(object, "labels");

    // Workloads and links are sets: a repeated key replaces the earlier entry.
    if (const json* workloads = optional_array(object, "workloads")) {
        for (const auto& entry : *workloads) {
            auto workload = parse_workload(entry);
            bool replaced = false;
            for (auto& existing : inventory.workloads) {
                if (existing.id == workload.id) {
                    existing = workload;
                    replaced = true;
                    break;
                }
            }
            if (!replaced) inventory.workloads.push_back(std::move(workload));
        }
    }
    if (const json* links = optional_array(object, "links")) {
        for (const auto& entry : *links) {
            auto link = parse_link(entry);
            bool replaced = false;
            for (auto& existing : inventory.links) {
                if (same_link(existing, link)) {
                    existing = link;
                    replaced = true;
                    break;
                }
            }
            if (!replaced) inventory.links.push_back(std::move(link));
        }
    }
    return inventory;
}

json scope_to_json(const Scope& scope) {
    switch (scope.type) {
        case Scope::Type::All:
            return {{"type", "all"}};
        case Scope::Type::Host:
            return {{"type", "host"}, {"target", scope.target}};
        case Scope::Type::Workload:
            return {{"type", "workload"}, {"target", scope.target}};
    }
    return {{"type", "all"}};
}

Scope parse_scope(const json& object) {
    if (!object.is_object()) {
        throw SchemaViolation("field 'scope' must be an object");
    }
    std::string type = require_string(object, "type");
    if (type == "all") return Scope::all();
    if (type == "host") return Scope::host(require_string(object, "target"));
    if (type == "workload") return Scope::workload(require_string(object, "target"));
    throw SchemaViolation("unknown scope type '" + type + "'");
}

/**
 * Parse the payload and pull out the correlation id, the two checks every
 * decoder shares.
 */
std::optional<DecodeError> parse_envelope(const std::string& payload, json& document,
                                          std::string& correlation_id) {
    document = json::parse(payload, nullptr, false);
    if (document.is_discarded()) {
        return DecodeError{DecodeError::Kind::MalformedEncoding, "payload is not valid JSON"};
    }
    if (!document.is_object()) {
        return DecodeError{DecodeError::Kind::SchemaMismatch, "payload must be a JSON object"};
    }
    auto it = document.find("correlation_id");
    if (it == document.end() || !it->is_string() || it->get<std::string>().empty()) {
        return DecodeError{DecodeError::Kind::CorrelationMissing, "payload has no correlation_id"};
    }
    correlation_id = it->get<std::string>();
    return std::nullopt;
}

} // anonymous namespace

std::string encode_request(const QueryRequest& request) {
    json document = {
        {"correlation_id", request.correlation_id},
        {"reply_to", request.reply_to},
        {"kind", to_string(request.kind)},
        {"scope", scope_to_json(request.scope)},
        {"timeout_ms", clamp_query_timeout(request.timeout).count()}
    };
    if (request.revision.has_value()) {
        document["revision"] = *request.revision;
    }
    if (!request.constraints.empty()) {
        document["constraints"] = request.constraints;
    }
    return document.dump();
}

DecodeResult<QueryRequest> decode_request(const std::string& payload) {
    json document;
    QueryRequest request;
    if (auto error = parse_envelope(payload, document, request.correlation_id)) {
        return *error;
    }
    try {
        request.reply_to = require_string(document, "reply_to");
        auto kind = parse_inventory_kind(require_string(document, "kind"));
        if (!kind) {
            throw SchemaViolation("unknown kind '" + document["kind"].get<std::string>() + "'");
        }
        request.kind = *kind;
        request.scope = parse_scope(require_field(document, "scope"));
        request.timeout = std::chrono::milliseconds(
            maybe_unsigned<uint32_t>(document, "timeout_ms").value_or(0));
        request.revision = maybe_unsigned<uint32_t>(document, "revision");
        request.constraints = string_map(document, "constraints");
    } catch (const SchemaViolation& e) {
        return DecodeError{DecodeError::Kind::SchemaMismatch, e.what()};
    } catch (const json::exception& e) {
        return DecodeError{DecodeError::Kind::SchemaMismatch, e.what()};
    }
    return request;
}

std::string encode_reply(const ReplyRecord& reply) {
    json document = {
        {"correlation_id", reply.correlation_id},
        {"host", reply.responder},
        {"kind", to_string(reply.kind)},
        {"inventory", to_json(reply.inventory)}
    };
    document["inventory"].erase("host_id");
    return document.dump();
}

DecodeResult<ReplyRecord> decode_reply(const std::string& payload) {
    json document;
    ReplyRecord reply;
    if (auto error = parse_envelope(payload, document, reply.correlation_id)) {
        return *error;
    }
    try {
        reply.responder = require_string(document, "host");
        if (reply.responder.empty()) {
            throw SchemaViolation("field 'host' must not be empty");
        }
        auto kind = parse_inventory_kind(require_string(document, "kind"));
        if (!kind) {
            throw SchemaViolation("unknown kind '" + document["kind"].get<std::string>() + "'");
        }
        reply.kind = *kind;

        auto it = document.find("inventory");
        if (it == document.end() || it->is_null()) {
            reply.inventory.host_id = reply.responder;
        } else {
            reply.inventory = parse_inventory(*it, reply.responder);
        }
    } catch (const SchemaViolation& e) {
        return DecodeError{DecodeError::Kind::SchemaMismatch, e.what()};
    } catch (const json::exception& e) {
        return DecodeError{DecodeError::Kind::SchemaMismatch, e.what()};
    }
    return reply;
}

std::string encode_launch_command(const std::string& actor_id, uint32_t revision) {
    return json{{"actor_id", actor_id}, {"revision", revision}}.dump();
}

std::string encode_terminate_command(const std::string& actor_id) {
    return json{{"actor_id", actor_id}}.dump();
}

json to_json(const WorkloadDescriptor& workload) {
    json object = {
        {"id", workload.id},
        {"kind", workload_kind_tag(workload)}
    };
    if (workload.revision) object["revision"] = *workload.revision;
    if (workload.image_ref) object["image_ref"] = *workload.image_ref;
    if (workload.name) object["name"] = *workload.name;
    if (workload.link_name) object["link_name"] = *workload.link_name;
    return object;
}

json to_json(const LinkBinding& link) {
    return {
        {"actor_id", link.actor_id},
        {"provider_id", link.provider_id},
        {"contract_id", link.contract_id},
        {"link_name", link.link_name},
        {"values", link.values}
    };
}

json to_json(const HostInventory& inventory) {
    json workloads = json::array();
    for (const auto& workload : inventory.workloads) {
        workloads.push_back(to_json(workload));
    }
    json links = json::array();
    for (const auto& link : inventory.links) {
        links.push_back(to_json(link));
    }
    return {
        {"host_id", inventory.host_id},
        {"uptime_ms", inventory.uptime_ms},
        {"labels", inventory.labels},
        {"workloads", workloads},
        {"links", links}
    };
}

json to_json(const AggregatedSnapshot& snapshot) {
    json hosts = json::array();
    for (const auto& host : snapshot.hosts) {
        hosts.push_back(to_json(host));
    }
    return {
        {"kind", to_string(snapshot.kind)},
        {"responded", snapshot.responded},
        {"started_at", helpers::format_time(snapshot.started_at)},
        {"finished_at", helpers::format_time(snapshot.finished_at)},
        {"total_workloads", snapshot.total_workloads},
        {"total_links", snapshot.total_links},
        {"hosts", hosts},
        {"stats", {
            {"received", snapshot.stats.received},
            {"accepted", snapshot.stats.accepted},
            {"duplicates", snapshot.stats.duplicates},
            {"decode_failures", snapshot.stats.decode_failures},
            {"mismatched", snapshot.stats.mismatched},
            {"late", snapshot.stats.late}
        }}
    };
}

} // namespace codec
} // namespace lattice
