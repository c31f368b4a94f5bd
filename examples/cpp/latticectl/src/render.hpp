#pragma once

#include <ostream>
#include <string>
#include "lattice/events.hpp"
#include "lattice/types.hpp"

namespace latticectl {

/**
 * Entity types accepted by "latticectl list".
 */
enum class EntityType {
    Hosts,
    Actors,
    Bindings,
    Capabilities
};

/**
 * Parse "hosts", "actors", "bindings", "capabilities" or "caps"
 * (case-insensitive, surrounding whitespace ignored).
 *
 * @throws lattice::InvalidArgumentError for anything else
 */
EntityType parse_entity_type(const std::string& value);

void render_hosts(std::ostream& out, const lattice::AggregatedSnapshot& snapshot);
void render_actors(std::ostream& out, const lattice::AggregatedSnapshot& snapshot);
void render_bindings(std::ostream& out, const lattice::AggregatedSnapshot& snapshot);
void render_capabilities(std::ostream& out, const lattice::AggregatedSnapshot& snapshot);

void render_json(std::ostream& out, const lattice::AggregatedSnapshot& snapshot);

void render_event(std::ostream& out, const lattice::BusEvent& event, bool json);

} // namespace latticectl
