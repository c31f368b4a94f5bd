#include <gtest/gtest.h>
#include <string>
#include <nlohmann/json.hpp>
#include "lattice/codec.hpp"
#include "lattice_fixtures.hpp"

using namespace lattice;
using namespace lattice::testing;
using nlohmann::json;

// =============================================================================
// Reply Decoding Tests
// =============================================================================

TEST(ReplyDecoderTest, Decode_ValidReply_ShouldPopulateInventory) {
    std::string payload = R"({
        "correlation_id": "c-1",
        "host": "NHOST1",
        "kind": "hosts",
        "inventory": {
            "uptime_ms": 42000,
            "labels": {"hostcore.os": "linux", "zone": "us-east"},
            "workloads": [
                {"id": "MACTOR", "kind": "actor", "revision": 3, "image_ref": "registry/echo:0.3", "name": "echo"},
                {"id": "VPROV", "kind": "capability-provider", "link_name": "default"},
                {"id": "XOTHER", "kind": "wasi-task"}
            ],
            "links": [
                {"actor_id": "MACTOR", "provider_id": "VPROV", "contract_id": "wasmcloud:httpserver",
                 "link_name": "default", "values": {"PORT": "8080"}}
            ]
        }
    })";

    auto result = codec::decode_reply(payload);

    ASSERT_TRUE(result.ok()) << result.error().message;
    const auto& reply = result.value();
    EXPECT_EQ(reply.correlation_id, "c-1");
    EXPECT_EQ(reply.responder, "NHOST1");
    EXPECT_EQ(reply.kind, InventoryKind::Hosts);
    EXPECT_EQ(reply.inventory.host_id, "NHOST1");
    EXPECT_EQ(reply.inventory.uptime_ms, 42000u);
    EXPECT_EQ(reply.inventory.labels.at("zone"), "us-east");

    ASSERT_EQ(reply.inventory.workloads.size(), 3u);
    EXPECT_EQ(reply.inventory.workloads[0].kind, WorkloadKind::Actor);
    EXPECT_EQ(reply.inventory.workloads[0].revision, 3u);
    EXPECT_EQ(reply.inventory.workloads[0].image_ref, "registry/echo:0.3");
    EXPECT_EQ(reply.inventory.workloads[1].kind, WorkloadKind::CapabilityProvider);
    EXPECT_EQ(reply.inventory.workloads[2].kind, WorkloadKind::Other);
    EXPECT_EQ(reply.inventory.workloads[2].kind_tag, "wasi-task");

    ASSERT_EQ(reply.inventory.links.size(), 1u);
    EXPECT_EQ(reply.inventory.links[0].values.at("PORT"), "8080");
}

TEST(ReplyDecoderTest, Decode_NotJson_ShouldReportMalformedEncoding) {
    auto result = codec::decode_reply("{not json");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, DecodeError::Kind::MalformedEncoding);
}

TEST(ReplyDecoderTest, Decode_BinaryGarbage_ShouldReportMalformedEncoding) {
    auto result = codec::decode_reply(std::string("\xff\xfe\x00\x01", 4));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, DecodeError::Kind::MalformedEncoding);
}

TEST(ReplyDecoderTest, Decode_MissingCorrelation_ShouldReportCorrelationMissing) {
    auto result = codec::decode_reply(R"({"host": "h1", "kind": "hosts"})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, DecodeError::Kind::CorrelationMissing);
}

TEST(ReplyDecoderTest, Decode_EmptyCorrelation_ShouldReportCorrelationMissing) {
    auto result = codec::decode_reply(R"({"correlation_id": "", "host": "h1", "kind": "hosts"})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, DecodeError::Kind::CorrelationMissing);
}

TEST(ReplyDecoderTest, Decode_MissingHost_ShouldReportSchemaMismatch) {
    auto result = codec::decode_reply(R"({"correlation_id": "c", "kind": "hosts"})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, DecodeError::Kind::SchemaMismatch);
}

TEST(ReplyDecoderTest, Decode_WrongFieldTypes_ShouldReportSchemaMismatch) {
    const char* payloads[] = {
        R"([1, 2, 3])",
        R"({"correlation_id": "c", "host": 7, "kind": "hosts"})",
        R"({"correlation_id": "c", "host": "h", "kind": "planets"})",
        R"({"correlation_id": "c", "host": "h", "kind": "hosts", "inventory": []})",
        R"({"correlation_id": "c", "host": "h", "kind": "hosts", "inventory": {"workloads": {}}})",
        R"({"correlation_id": "c", "host": "h", "kind": "hosts", "inventory": {"workloads": [{"kind": "actor"}]}})",
        R"({"correlation_id": "c", "host": "h", "kind": "hosts", "inventory": {"labels": {"a": 1}}})",
        R"({"correlation_id": "c", "host": "h", "kind": "hosts", "inventory": {"uptime_ms": -5}})",
        R"({"correlation_id": "c", "host": "h", "kind": "links", "inventory": {"links": [{"actor_id": "M"}]}})",
    };

    for (const char* payload : payloads) {
        auto result = codec::decode_reply(payload);
        ASSERT_FALSE(result.ok()) << payload;
        EXPECT_EQ(result.error().kind, DecodeError::Kind::SchemaMismatch) << payload;
    }
}

TEST(ReplyDecoderTest, Decode_RepeatedWorkloadId_ShouldKeepOneEntry) {
    std::string payload = R"({
        "correlation_id": "c", "host": "h", "kind": "workloads",
        "inventory": {"workloads": [
            {"id": "M1", "kind": "actor", "revision": 1},
            {"id": "M2", "kind": "actor"},
            {"id": "M1", "kind": "actor", "revision": 2}
        ]}
    })";

    auto result = codec::decode_reply(payload);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().inventory.workloads.size(), 2u);
    EXPECT_EQ(result.value().inventory.workloads[0].revision, 2u);
}

TEST(ReplyDecoderTest, Decode_AuctionReplyWithoutInventory_ShouldSucceed) {
    auto result = codec::decode_reply(R"({"correlation_id": "c", "host": "h7", "kind": "auction"})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().kind, InventoryKind::Auction);
    EXPECT_EQ(result.value().inventory.host_id, "h7");
    EXPECT_TRUE(result.value().inventory.workloads.empty());
}

TEST(ReplyDecoderTest, EncodeThenDecode_ShouldPreserveCorrelationIdExactly) {
    std::string correlation = "9b2f6a1e-3c4d-4e5f-8a9b-0c1d2e3f4a5b";
    auto host = inventory("NHOST", 2);
    host.links.push_back(binding_to("NHOST-a0", "wasmcloud:keyvalue"));

    auto result = codec::decode_reply(reply_payload(correlation, host));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().correlation_id, correlation);
    EXPECT_EQ(result.value().inventory.workloads, host.workloads);
    EXPECT_EQ(result.value().inventory.links, host.links);
    EXPECT_EQ(result.value().inventory.labels, host.labels);
}

// =============================================================================
// Request Encoding Tests
// =============================================================================

TEST(RequestCodecTest, Encode_ShouldCarryScopeAndReplySubject) {
    QueryRequest request;
    request.kind = InventoryKind::Workloads;
    request.scope = Scope::host("N1");
    request.correlation_id = "c-9";
    request.reply_to = "_INBOX.c-9";
    request.timeout = std::chrono::milliseconds(250);

    auto document = json::parse(codec::encode_request(request));

    EXPECT_EQ(document["correlation_id"], "c-9");
    EXPECT_EQ(document["reply_to"], "_INBOX.c-9");
    EXPECT_EQ(document["kind"], "workloads");
    EXPECT_EQ(document["scope"]["type"], "host");
    EXPECT_EQ(document["scope"]["target"], "N1");
    EXPECT_EQ(document["timeout_ms"], 250);
    EXPECT_FALSE(document.contains("revision"));
}

TEST(RequestCodecTest, EncodeThenDecode_OversizedTimeout_ShouldClampToWireMaximum) {
    QueryRequest request;
    request.correlation_id = "c-max";
    request.reply_to = "_INBOX.c-max";
    request.timeout = std::chrono::milliseconds::max();

    auto result = codec::decode_request(codec::encode_request(request));

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result.value().timeout, MAX_QUERY_TIMEOUT);
}

TEST(RequestCodecTest, Decode_AuctionRequest_ShouldReadConstraints) {
    QueryRequest request;
    request.kind = InventoryKind::Auction;
    request.scope = Scope::workload("MACTOR");
    request.correlation_id = "c-1";
    request.reply_to = "_INBOX.c-1";
    request.revision = 4;
    request.constraints = {{"region", "eu"}};

    auto result = codec::decode_request(codec::encode_request(request));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().scope, Scope::workload("MACTOR"));
    EXPECT_EQ(result.value().revision, 4u);
    EXPECT_EQ(result.value().constraints.at("region"), "eu");
}

TEST(RequestCodecTest, Decode_UnknownScope_ShouldReportSchemaMismatch) {
    auto result = codec::decode_request(
        R"({"correlation_id": "c", "reply_to": "_INBOX.c", "kind": "hosts", "scope": {"type": "galaxy"}})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, DecodeError::Kind::SchemaMismatch);
}

TEST(RequestCodecTest, ControlCommands_ShouldCarryActorId) {
    auto launch = json::parse(codec::encode_launch_command("MACTOR", 2));
    auto terminate = json::parse(codec::encode_terminate_command("MACTOR"));

    EXPECT_EQ(launch["actor_id"], "MACTOR");
    EXPECT_EQ(launch["revision"], 2);
    EXPECT_EQ(terminate["actor_id"], "MACTOR");
}

TEST(SnapshotJsonTest, ToJson_ShouldListHostsAndTotals) {
    AggregatedSnapshot snapshot;
    snapshot.hosts.push_back(inventory("h1", 2));
    snapshot.total_workloads = 2;
    snapshot.responded = true;

    auto document = codec::to_json(snapshot);

    EXPECT_EQ(document["hosts"].size(), 1u);
    EXPECT_EQ(document["hosts"][0]["host_id"], "h1");
    EXPECT_EQ(document["total_workloads"], 2);
    EXPECT_EQ(document["responded"], true);
}
