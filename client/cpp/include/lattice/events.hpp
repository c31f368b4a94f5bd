#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "codec.hpp"

namespace lattice {

/**
 * Something that happened on the lattice, as announced by a host.
 */
struct BusEvent {
    enum class Type {
        HostStarted,
        HostStopped,
        ActorStarting,
        ActorStarted,
        ActorStopped,
        ActorUpdating,
        ActorUpdateComplete,
        ProviderLoaded,
        ProviderRemoved,
        ActorBindingCreated,
        ActorBindingRemoved,
        ActorBecameHealthy,
        ActorBecameUnhealthy
    };

    Type type = Type::HostStarted;
    std::string host;
    std::string actor;
    std::string capid;
    std::string instance_name;
    bool success = false;

    /**
     * Wire tag, e.g. "ActorStarted".
     */
    const char* name() const;

    /**
     * CloudEvents type, e.g. "wasmbus.events.actor_started".
     */
    std::string event_type() const;

    /**
     * CloudEvents subject: the host, actor, "capid.instance" or
     * "actor.capid.instance" the event is about.
     */
    std::string subject() const;

    /**
     * Human readable one-liner, e.g. "[Nxx] Actor Mxx started".
     */
    std::string to_string() const;

    /**
     * Externally tagged JSON, e.g. {"ActorStarted":{"actor":"M..","host":"N.."}}.
     */
    nlohmann::json to_json() const;

    static DecodeResult<BusEvent> from_json(const nlohmann::json& document);

    bool operator==(const BusEvent& other) const {
        return type == other.type && host == other.host && actor == other.actor &&
               capid == other.capid && instance_name == other.instance_name &&
               success == other.success;
    }
};

/**
 * CloudEvents 1.0 envelope carrying a JSON-encoded BusEvent in data.
 */
struct CloudEvent {
    static constexpr const char* SPEC_VERSION = "1.0";
    static constexpr const char* TYPE_VERSION = "0.1";
    static constexpr const char* SOURCE = "https://wascc.dev/lattice/events";
    static constexpr const char* CONTENT_TYPE = "application/json";

    std::string spec_version = SPEC_VERSION;
    std::string event_type;
    std::string event_type_version = TYPE_VERSION;
    std::string source = SOURCE;
    std::string event_id;
    std::chrono::system_clock::time_point event_time;
    std::string content_type = CONTENT_TYPE;
    std::optional<std::string> subject;
    std::string data;

    /**
     * Wrap an event with a fresh id and the current time.
     */
    static CloudEvent wrap(const BusEvent& event);

    std::string encode() const;

    static DecodeResult<CloudEvent> decode(const std::string& payload);

    /**
     * Decode the BusEvent carried in data.
     */
    DecodeResult<BusEvent> event() const;
};

} // namespace lattice
