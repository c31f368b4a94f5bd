#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace lattice {

/**
 * Connection and query defaults for a LatticeClient.
 *
 * Production deployments use environment variables for configuration, the
 * same ones the lattice hosts read:
 *
 * - LATTICE_HOST: gateway endpoint (default "127.0.0.1:4222")
 * - LATTICE_CREDS_FILE: access token file, enables TLS when set
 * - LATTICE_RPC_TIMEOUT_MILLIS: default query timeout (default 600)
 * - LATTICE_NAMESPACE: optional subject namespace
 */
struct ClientConfig {
    static constexpr const char* DEFAULT_ENDPOINT = "127.0.0.1:4222";
    static constexpr std::size_t DEFAULT_MAX_PAYLOAD = 1024 * 1024;

    std::string endpoint = DEFAULT_ENDPOINT;
    std::optional<std::string> creds_file;
    std::chrono::milliseconds timeout{600};
    std::string lattice_namespace;
    std::size_t max_payload_bytes = DEFAULT_MAX_PAYLOAD;

    /**
     * Build a config from the environment, falling back to defaults.
     *
     * @throws InvalidArgumentError if LATTICE_RPC_TIMEOUT_MILLIS is not a
     *         positive integer or LATTICE_NAMESPACE is not a subject token
     */
    static ClientConfig from_env();

    /**
     * Parse a millisecond timeout given as decimal text.
     *
     * @param source names the setting in the error message
     * @throws InvalidArgumentError unless value is a positive integer
     */
    static std::chrono::milliseconds parse_timeout(const std::string& value, const std::string& source);

    /**
     * Strip an http:// or https:// prefix, gRPC wants plain host:port.
     */
    static std::string format_endpoint(const std::string& endpoint) {
        auto pos = endpoint.find("://");
        if (pos == std::string::npos) {
            return endpoint;
        }
        return endpoint.substr(pos + 3);
    }
};

} // namespace lattice
