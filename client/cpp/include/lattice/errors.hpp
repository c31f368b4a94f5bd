#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace lattice {

struct AggregatedSnapshot;

/**
 * Base exception for all lattice client errors.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }

    /**
     * Returns true if the caller aborted the operation.
     */
    virtual bool is_cancelled() const { return false; }

    /**
     * Returns true if fewer replies arrived than the caller required.
     */
    virtual bool is_insufficient() const { return false; }
};

/**
 * Thrown when publishing or subscribing on the bus fails.
 */
class TransportError : public ClientError {
public:
    explicit TransportError(const std::string& message)
        : ClientError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when a call to the bus gateway fails.
 */
class GrpcError : public TransportError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : TransportError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_connection_error() const override {
        return status_code_ == grpc::StatusCode::UNAVAILABLE ||
               status_code_ == grpc::StatusCode::DEADLINE_EXCEEDED ||
               status_code_ == grpc::StatusCode::RESOURCE_EXHAUSTED;
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when connection to the gateway cannot be set up.
 */
class ConnectionError : public ClientError {
public:
    explicit ConnectionError(const std::string& message)
        : ClientError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public ClientError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : ClientError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Outcome of a scatter-gather query that did not produce a snapshot.
 *
 * A query that simply times out is not an error; it resolves to a
 * (possibly empty) snapshot. QueryError covers the three cases that do
 * not: the transport failed, the caller cancelled, or the caller asked for
 * a minimum number of replies that did not arrive. In the last case the
 * partial snapshot is available through partial(). A Transport outcome
 * keeps the underlying TransportError: its predicates and gRPC status code
 * are forwarded, and cause() rethrows it.
 */
class QueryError : public ClientError {
public:
    enum class Kind {
        Transport,
        Insufficient,
        Cancelled
    };

    /**
     * Wrap a transport failure. Pass std::current_exception() as origin
     * from inside the handler to keep the dynamic type of the cause.
     */
    static QueryError transport(const TransportError& cause, std::exception_ptr origin = nullptr) {
        QueryError error(Kind::Transport, std::string("transport failure: ") + cause.what());
        error.cause_ = origin ? origin : std::make_exception_ptr(cause);
        error.cause_invalid_argument_ = cause.is_invalid_argument();
        error.cause_connection_error_ = cause.is_connection_error();
        if (auto grpc_error = dynamic_cast<const GrpcError*>(&cause)) {
            error.status_code_ = grpc_error->status_code();
        }
        return error;
    }

    static QueryError cancelled() {
        return QueryError(Kind::Cancelled, "query cancelled");
    }

    static QueryError insufficient(std::size_t required, std::size_t received,
                                   std::shared_ptr<const AggregatedSnapshot> partial) {
        QueryError error(Kind::Insufficient,
                         "expected at least " + std::to_string(required) + " replies, received " +
                             std::to_string(received));
        error.partial_ = std::move(partial);
        return error;
    }

    Kind kind() const { return kind_; }

    /**
     * Snapshot collected before an Insufficient outcome, or null.
     */
    const AggregatedSnapshot* partial() const { return partial_.get(); }

    /**
     * The wrapped TransportError for a Transport outcome, or null.
     */
    std::exception_ptr cause() const { return cause_; }

    /**
     * gRPC status of the wrapped error when it came from the gateway.
     */
    std::optional<grpc::StatusCode> status_code() const { return status_code_; }

    bool is_invalid_argument() const override {
        return kind_ == Kind::Transport && cause_invalid_argument_;
    }
    bool is_connection_error() const override {
        return kind_ == Kind::Transport && cause_connection_error_;
    }
    bool is_cancelled() const override { return kind_ == Kind::Cancelled; }
    bool is_insufficient() const override { return kind_ == Kind::Insufficient; }

private:
    QueryError(Kind kind, const std::string& message)
        : ClientError(message), kind_(kind) {}

    Kind kind_;
    std::shared_ptr<const AggregatedSnapshot> partial_;
    std::exception_ptr cause_;
    std::optional<grpc::StatusCode> status_code_;
    bool cause_invalid_argument_ = false;
    bool cause_connection_error_ = false;
};

} // namespace lattice
