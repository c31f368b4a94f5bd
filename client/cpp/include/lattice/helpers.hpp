#pragma once

#include <chrono>
#include <string>

namespace lattice {

/**
 * Helper functions shared by the query core.
 */
namespace helpers {

/**
 * Generate a random UUID v4 string, used for correlation ids.
 */
std::string generate_uuid();

/**
 * Format a wall clock time as ISO-8601 UTC with millisecond precision.
 */
std::string format_time(std::chrono::system_clock::time_point time);

/**
 * Parse an RFC 3339 timestamp ("2020-05-01T12:00:00Z", optional fraction
 * and numeric offset).
 *
 * @throws InvalidArgumentError if the timestamp cannot be parsed
 */
std::chrono::system_clock::time_point parse_time(const std::string& text);

} // namespace helpers
} // namespace lattice
