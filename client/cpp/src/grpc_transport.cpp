#include "lattice/grpc_transport.hpp"

#include <fstream>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>
#include "lattice/logging.hpp"

namespace lattice {

namespace {

constexpr const char* COMPONENT = "grpc_transport";

/**
 * A Subscribe stream drained into a queue by a reader thread.
 */
class GrpcSubscription : public Subscription {
public:
    GrpcSubscription(bus::BusGateway::Stub& stub, const std::string& pattern)
        : queue_(pattern), context_(std::make_unique<grpc::ClientContext>()) {
        bus::SubscribeRequest request;
        request.set_subject(pattern);
        reader_ = stub.Subscribe(context_.get(), request);
    }

    ~GrpcSubscription() override { close(); }

    /**
     * Start the reader thread and wait until the gateway confirms the
     * subscription or the timeout passes.
     */
    bool start(std::chrono::milliseconds timeout) {
        auto ready = ready_.get_future();
        reader_thread_ = std::thread([this] { read_loop(); });
        return ready.wait_for(timeout) == std::future_status::ready;
    }

    std::optional<RawMessage> next(std::chrono::steady_clock::time_point deadline) override {
        return queue_.next(deadline);
    }

    void close() override {
        std::call_once(close_once_, [this] {
            queue_.close();
            context_->TryCancel();
            if (reader_thread_.joinable()) {
                reader_thread_.join();
            }
        });
    }

    bool is_closed() const override { return queue_.is_closed(); }

    const std::string& pattern() const override { return queue_.pattern(); }

private:
    void read_loop() {
        reader_->WaitForInitialMetadata();
        ready_.set_value();

        bus::BusMessage message;
        while (reader_->Read(&message)) {
            queue_.deliver(RawMessage{message.subject(), message.payload(),
                                      std::chrono::steady_clock::now()});
        }
        auto status = reader_->Finish();
        if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
            log_warn(COMPONENT, "subscription_ended", {
                {"subject", queue_.pattern()},
                {"code", static_cast<int>(status.error_code())},
                {"error", status.error_message()}
            });
        }
        // The stream is gone; a pending next() must not wait for the deadline.
        queue_.close();
    }

    QueuedSubscription queue_;
    std::unique_ptr<grpc::ClientContext> context_;
    std::unique_ptr<grpc::ClientReader<bus::BusMessage>> reader_;
    std::promise<void> ready_;
    std::thread reader_thread_;
    std::once_flag close_once_;
};

std::string read_token(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConnectionError("cannot read credentials file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string token = buffer.str();
    auto end = token.find_last_not_of(" \t\r\n");
    token.erase(end == std::string::npos ? 0 : end + 1);
    if (token.empty()) {
        throw ConnectionError("credentials file is empty: " + path);
    }
    return token;
}

} // anonymous namespace

std::shared_ptr<GrpcTransport> GrpcTransport::connect(const ClientConfig& config) {
    std::shared_ptr<grpc::ChannelCredentials> credentials;
    if (config.creds_file.has_value()) {
        credentials = grpc::CompositeChannelCredentials(
            grpc::SslCredentials(grpc::SslCredentialsOptions()),
            grpc::AccessTokenCredentials(read_token(*config.creds_file)));
    } else {
        credentials = grpc::InsecureChannelCredentials();
    }
    auto channel = grpc::CreateChannel(ClientConfig::format_endpoint(config.endpoint), credentials);
    return std::make_shared<GrpcTransport>(channel, config.max_payload_bytes);
}

GrpcTransport::GrpcTransport(std::shared_ptr<grpc::Channel> channel, std::size_t max_payload_bytes,
                             std::chrono::milliseconds call_timeout)
    : channel_(std::move(channel))
    , stub_(bus::BusGateway::NewStub(channel_))
    , max_payload_bytes_(max_payload_bytes)
    , call_timeout_(call_timeout) {}

void GrpcTransport::publish(const std::string& topic, const std::string& payload) {
    if (payload.size() > max_payload_bytes_) {
        throw TransportError("payload of " + std::to_string(payload.size()) +
                             " bytes exceeds the maximum of " + std::to_string(max_payload_bytes_));
    }

    bus::PublishRequest request;
    request.set_subject(topic);
    request.set_payload(payload);

    bus::PublishResponse response;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + call_timeout_);
    auto status = stub_->Publish(&context, request, &response);
    if (!status.ok()) {
        throw GrpcError(status.error_message(), status.error_code());
    }
}

std::unique_ptr<Subscription> GrpcTransport::subscribe_ephemeral(const std::string& pattern) {
    auto subscription = std::make_unique<GrpcSubscription>(*stub_, pattern);
    if (!subscription->start(call_timeout_)) {
        subscription->close();
        throw TransportError("gateway did not confirm subscription to " + pattern);
    }
    if (subscription->is_closed()) {
        throw TransportError("gateway rejected subscription to " + pattern);
    }
    return subscription;
}

} // namespace lattice
