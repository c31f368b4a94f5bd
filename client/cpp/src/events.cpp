#include "lattice/events.hpp"

#include <array>
#include "lattice/errors.hpp"
#include "lattice/helpers.hpp"

using nlohmann::json;

namespace lattice {

namespace {

constexpr const char* EVENT_TYPE_PREFIX = "wasmbus.events";

struct TypeInfo {
    BusEvent::Type type;
    const char* tag;
    const char* suffix;
};

constexpr std::array<TypeInfo, 13> TYPES = {{
    {BusEvent::Type::HostStarted, "HostStarted", "host_started"},
    {BusEvent::Type::HostStopped, "HostStopped", "host_stopped"},
    {BusEvent::Type::ActorStarting, "ActorStarting", "actor_starting"},
    {BusEvent::Type::ActorStarted, "ActorStarted", "actor_started"},
    {BusEvent::Type::ActorStopped, "ActorStopped", "actor_stopped"},
    {BusEvent::Type::ActorUpdating, "ActorUpdating", "actor_updating"},
    {BusEvent::Type::ActorUpdateComplete, "ActorUpdateComplete", "actor_update_complete"},
    {BusEvent::Type::ProviderLoaded, "ProviderLoaded", "provider_loaded"},
    {BusEvent::Type::ProviderRemoved, "ProviderRemoved", "provider_removed"},
    {BusEvent::Type::ActorBindingCreated, "ActorBindingCreated", "actor_binding_created"},
    {BusEvent::Type::ActorBindingRemoved, "ActorBindingRemoved", "actor_binding_removed"},
    {BusEvent::Type::ActorBecameHealthy, "ActorBecameHealthy", "actor_became_healthy"},
    {BusEvent::Type::ActorBecameUnhealthy, "ActorBecameUnhealthy", "actor_became_unhealthy"},
}};

const TypeInfo& info(BusEvent::Type type) {
    for (const auto& entry : TYPES) {
        if (entry.type == type) return entry;
    }
    return TYPES[0];
}

bool is_host_only(BusEvent::Type type) {
    return type == BusEvent::Type::HostStarted || type == BusEvent::Type::HostStopped;
}

bool is_provider(BusEvent::Type type) {
    return type == BusEvent::Type::ProviderLoaded || type == BusEvent::Type::ProviderRemoved;
}

bool is_binding(BusEvent::Type type) {
    return type == BusEvent::Type::ActorBindingCreated || type == BusEvent::Type::ActorBindingRemoved;
}

DecodeError schema_error(const std::string& message) {
    return DecodeError{DecodeError::Kind::SchemaMismatch, message};
}

bool read_string(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // anonymous namespace

const char* BusEvent::name() const {
    return info(type).tag;
}

std::string BusEvent::event_type() const {
    return std::string(EVENT_TYPE_PREFIX) + "." + info(type).suffix;
}

std::string BusEvent::subject() const {
    if (is_host_only(type)) return host;
    if (is_provider(type)) return capid + "." + instance_name;
    if (is_binding(type)) return actor + "." + capid + "." + instance_name;
    return actor;
}

std::string BusEvent::to_string() const {
    std::string prefix = "[" + host + "] ";
    switch (type) {
        case Type::HostStarted: return prefix + "Host started";
        case Type::HostStopped: return prefix + "Host stopped";
        case Type::ActorStarting: return prefix + "Actor " + actor + " starting";
        case Type::ActorStarted: return prefix + "Actor " + actor + " started";
        case Type::ActorStopped: return prefix + "Actor " + actor + " stopped";
        case Type::ActorUpdating: return prefix + "Actor " + actor + " updating";
        case Type::ActorUpdateComplete:
            return prefix + "Actor " + actor + " update " + (success ? "succeeded" : "failed");
        case Type::ProviderLoaded: return prefix + "Provider " + capid + "," + instance_name + " loaded";
        case Type::ProviderRemoved: return prefix + "Provider " + capid + "," + instance_name + " removed";
        case Type::ActorBindingCreated:
            return prefix + "Actor " + actor + " bound to " + capid + "," + instance_name;
        case Type::ActorBindingRemoved:
            return prefix + "Actor " + actor + " un-bound from " + capid + "," + instance_name;
        case Type::ActorBecameHealthy: return prefix + "Actor " + actor + " became healthy";
        case Type::ActorBecameUnhealthy: return prefix + "Actor " + actor + " became unhealthy";
    }
    return prefix;
}

json BusEvent::to_json() const {
    if (is_host_only(type)) {
        return {{name(), host}};
    }
    json body = {{"host", host}};
    if (is_provider(type)) {
        body["capid"] = capid;
        body["instance_name"] = instance_name;
    } else if (is_binding(type)) {
        body["actor"] = actor;
        body["capid"] = capid;
        body["instance_name"] = instance_name;
    } else {
        body["actor"] = actor;
        if (type == Type::ActorUpdateComplete) {
            body["success"] = success;
        }
    }
    return {{name(), body}};
}

DecodeResult<BusEvent> BusEvent::from_json(const json& document) {
    if (!document.is_object() || document.size() != 1) {
        return schema_error("bus event must be an object with a single tag");
    }
    const auto& tag = document.begin().key();
    const auto& body = document.begin().value();

    BusEvent event;
    bool known = false;
    for (const auto& entry : TYPES) {
        if (tag == entry.tag) {
            event.type = entry.type;
            known = true;
            break;
        }
    }
    if (!known) {
        return schema_error("unknown bus event '" + tag + "'");
    }

    if (is_host_only(event.type)) {
        if (!body.is_string()) return schema_error(tag + " must carry a host id");
        event.host = body.get<std::string>();
        return event;
    }

    if (!body.is_object() || !read_string(body, "host", event.host)) {
        return schema_error(tag + " is missing 'host'");
    }
    if (is_provider(event.type) || is_binding(event.type)) {
        if (!read_string(body, "capid", event.capid) ||
            !read_string(body, "instance_name", event.instance_name)) {
            return schema_error(tag + " is missing 'capid' or 'instance_name'");
        }
    }
    if (!is_provider(event.type) && !read_string(body, "actor", event.actor)) {
        return schema_error(tag + " is missing 'actor'");
    }
    if (event.type == Type::ActorUpdateComplete) {
        auto it = body.find("success");
        if (it == body.end() || !it->is_boolean()) {
            return schema_error(tag + " is missing 'success'");
        }
        event.success = it->get<bool>();
    }
    return event;
}

CloudEvent CloudEvent::wrap(const BusEvent& event) {
    CloudEvent envelope;
    envelope.event_type = event.event_type();
    envelope.event_id = helpers::generate_uuid();
    envelope.event_time = std::chrono::system_clock::now();
    envelope.subject = event.subject();
    envelope.data = event.to_json().dump();
    return envelope;
}

std::string CloudEvent::encode() const {
    json document = {
        {"specversion", spec_version},
        {"type", event_type},
        {"typeversion", event_type_version},
        {"source", source},
        {"id", event_id},
        {"time", helpers::format_time(event_time)},
        {"datacontenttype", content_type},
        {"data", data}
    };
    if (subject.has_value()) {
        document["subject"] = *subject;
    }
    return document.dump();
}

DecodeResult<CloudEvent> CloudEvent::decode(const std::string& payload) {
    json document = json::parse(payload, nullptr, false);
    if (document.is_discarded()) {
        return DecodeError{DecodeError::Kind::MalformedEncoding, "event is not valid JSON"};
    }
    if (!document.is_object()) {
        return schema_error("event must be a JSON object");
    }

    CloudEvent envelope;
    std::string time;
    if (!read_string(document, "specversion", envelope.spec_version) ||
        !read_string(document, "type", envelope.event_type) ||
        !read_string(document, "source", envelope.source) ||
        !read_string(document, "id", envelope.event_id) ||
        !read_string(document, "time", time) ||
        !read_string(document, "data", envelope.data)) {
        return schema_error("event is missing a required CloudEvents attribute");
    }
    read_string(document, "typeversion", envelope.event_type_version);
    read_string(document, "datacontenttype", envelope.content_type);

    std::string subject;
    if (read_string(document, "subject", subject)) {
        envelope.subject = subject;
    }

    try {
        envelope.event_time = helpers::parse_time(time);
    } catch (const InvalidArgumentError& e) {
        return schema_error(e.what());
    }
    return envelope;
}

DecodeResult<BusEvent> CloudEvent::event() const {
    json document = json::parse(data, nullptr, false);
    if (document.is_discarded()) {
        return DecodeError{DecodeError::Kind::MalformedEncoding, "event data is not valid JSON"};
    }
    return BusEvent::from_json(document);
}

} // namespace lattice
