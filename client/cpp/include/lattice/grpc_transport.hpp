#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "lattice/bus.grpc.pb.h"
#include "config.hpp"
#include "transport.hpp"

namespace lattice {

/**
 * Transport backed by a BusGateway service.
 *
 * publish() is a unary Publish call. Each subscription is a Subscribe
 * stream drained by its own reader thread into a QueuedSubscription;
 * closing the subscription cancels the call and joins the thread.
 *
 * Example:
 *   auto transport = GrpcTransport::connect(ClientConfig::from_env());
 *   transport->publish("wasmbus.inventory.hosts", payload);
 */
class GrpcTransport : public Transport {
public:
    /**
     * Create a channel to config.endpoint.
     *
     * Uses TLS with access-token credentials when config.creds_file is set.
     *
     * @throws ConnectionError if the credentials file cannot be read
     */
    static std::shared_ptr<GrpcTransport> connect(const ClientConfig& config);

    /**
     * Create a transport over an existing channel.
     */
    explicit GrpcTransport(std::shared_ptr<grpc::Channel> channel,
                           std::size_t max_payload_bytes = ClientConfig::DEFAULT_MAX_PAYLOAD,
                           std::chrono::milliseconds call_timeout = std::chrono::milliseconds(5000));

    void publish(const std::string& topic, const std::string& payload) override;

    std::unique_ptr<Subscription> subscribe_ephemeral(const std::string& pattern) override;

private:
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<bus::BusGateway::Stub> stub_;
    std::size_t max_payload_bytes_;
    std::chrono::milliseconds call_timeout_;
};

} // namespace lattice
