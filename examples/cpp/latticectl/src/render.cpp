#include "render.hpp"

#include <algorithm>
#include <cctype>
#include "lattice/codec.hpp"
#include "lattice/errors.hpp"

using namespace lattice;

namespace latticectl {

namespace {

std::string trim_lower(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    std::string result = value.substr(begin, end - begin + 1);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string join_keys(const Labels& labels) {
    std::string joined;
    for (const auto& [key, value] : labels) {
        if (!joined.empty()) joined += ",";
        joined += key;
    }
    return joined;
}

} // anonymous namespace

EntityType parse_entity_type(const std::string& value) {
    auto normalized = trim_lower(value);
    if (normalized == "hosts") return EntityType::Hosts;
    if (normalized == "actors") return EntityType::Actors;
    if (normalized == "bindings") return EntityType::Bindings;
    if (normalized == "capabilities" || normalized == "caps") return EntityType::Capabilities;
    throw InvalidArgumentError("Unknown entity type. Valid types are: hosts, actors, capabilities, bindings");
}

void render_hosts(std::ostream& out, const AggregatedSnapshot& snapshot) {
    for (const auto& host : snapshot.hosts) {
        out << "[" << host.host_id << "] Uptime " << host.uptime_ms / 1000
            << "s, Labels: " << join_keys(host.labels) << "\n";
    }
}

void render_actors(std::ostream& out, const AggregatedSnapshot& snapshot) {
    for (const auto& host : snapshot.hosts) {
        out << "\nHost " << host.host_id << ":\n";
        for (const auto& workload : host.workloads) {
            if (workload.kind != WorkloadKind::Actor) continue;
            out << "\t" << workload.id << " - " << workload.name.value_or(workload.id)
                << "  " << workload.image_ref.value_or("???")
                << " (" << workload.revision.value_or(0) << ")\n";
        }
    }
}

void render_bindings(std::ostream& out, const AggregatedSnapshot& snapshot) {
    for (const auto& host : snapshot.hosts) {
        out << "Host " << host.host_id << "\n";
        for (const auto& link : host.links) {
            out << "\t" << link.actor_id << " -> " << link.contract_id << "," << link.link_name
                << " - " << link.values.size() << " values\n";
        }
    }
}

void render_capabilities(std::ostream& out, const AggregatedSnapshot& snapshot) {
    for (const auto& host : snapshot.hosts) {
        out << host.host_id << "\n";
        for (const auto& workload : host.workloads) {
            if (workload.kind != WorkloadKind::CapabilityProvider) continue;
            out << "\t" << workload.id << "," << workload.link_name.value_or("default");
            if (workload.image_ref) {
                out << " - " << *workload.image_ref;
            }
            out << "\n";
        }
    }
}

void render_json(std::ostream& out, const AggregatedSnapshot& snapshot) {
    out << codec::to_json(snapshot).dump() << "\n";
}

void render_event(std::ostream& out, const BusEvent& event, bool json) {
    if (json) {
        out << event.to_json().dump() << std::endl;
    } else {
        out << event.to_string() << std::endl;
    }
}

} // namespace latticectl
