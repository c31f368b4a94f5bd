#include "lattice/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include "lattice/errors.hpp"
#include "lattice/validation.hpp"

namespace lattice {

ClientConfig ClientConfig::from_env() {
    ClientConfig config;

    if (const char* host = std::getenv("LATTICE_HOST")) {
        if (*host) config.endpoint = format_endpoint(host);
    }

    if (const char* creds = std::getenv("LATTICE_CREDS_FILE")) {
        if (*creds) config.creds_file = std::string(creds);
    }

    if (const char* timeout = std::getenv("LATTICE_RPC_TIMEOUT_MILLIS")) {
        config.timeout = parse_timeout(timeout, "LATTICE_RPC_TIMEOUT_MILLIS");
    }

    if (const char* ns = std::getenv("LATTICE_NAMESPACE")) {
        if (*ns) {
            validation::require_subject_token(ns, "LATTICE_NAMESPACE");
            config.lattice_namespace = ns;
        }
    }

    return config;
}

std::chrono::milliseconds ClientConfig::parse_timeout(const std::string& value, const std::string& source) {
    long long millis = 0;
    try {
        std::size_t consumed = 0;
        millis = std::stoll(value, &consumed);
        if (consumed != value.size()) millis = 0;
    } catch (const std::invalid_argument&) {
        millis = 0;
    } catch (const std::out_of_range&) {
        millis = 0;
    }
    if (millis <= 0) {
        throw InvalidArgumentError(source + " must be a positive integer: " + value);
    }
    return std::chrono::milliseconds(millis);
}

} // namespace lattice
