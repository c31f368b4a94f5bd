#pragma once

#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace lattice {

/**
 * Why an inbound payload was rejected.
 */
struct DecodeError {
    enum class Kind {
        MalformedEncoding,
        SchemaMismatch,
        CorrelationMissing
    };

    Kind kind = Kind::MalformedEncoding;
    std::string message;
};

const char* to_string(DecodeError::Kind kind);

/**
 * Result of decoding an inbound payload: a value or a DecodeError.
 */
template<typename T>
class DecodeResult {
public:
    DecodeResult(T value) : value_(std::move(value)) {}
    DecodeResult(DecodeError error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    T take() { return std::move(*value_); }

    const DecodeError& error() const { return error_; }

private:
    std::optional<T> value_;
    DecodeError error_;
};

/**
 * JSON wire codec for lattice requests and replies.
 *
 * Decoders never throw: malformed input comes back as a DecodeError so a
 * bad reply from one host cannot abort a query.
 */
namespace codec {

std::string encode_request(const QueryRequest& request);

DecodeResult<QueryRequest> decode_request(const std::string& payload);

std::string encode_reply(const ReplyRecord& reply);

DecodeResult<ReplyRecord> decode_reply(const std::string& payload);

/**
 * Launch command sent to a single host.
 */
std::string encode_launch_command(const std::string& actor_id, uint32_t revision);

/**
 * Terminate command sent to a single host.
 */
std::string encode_terminate_command(const std::string& actor_id);

nlohmann::json to_json(const WorkloadDescriptor& workload);
nlohmann::json to_json(const LinkBinding& link);
nlohmann::json to_json(const HostInventory& inventory);
nlohmann::json to_json(const AggregatedSnapshot& snapshot);

} // namespace codec
} // namespace lattice
