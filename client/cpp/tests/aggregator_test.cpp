#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "lattice/aggregator.hpp"
#include "lattice_fixtures.hpp"

using namespace lattice;
using namespace lattice::testing;

// =============================================================================
// ReplySet Tests
// =============================================================================

class ReplySetTest : public ::testing::Test {
protected:
    ReplyRecord make_reply(const std::string& host, std::size_t actors) {
        ReplyRecord reply;
        reply.correlation_id = "corr-1";
        reply.responder = host;
        reply.inventory = inventory(host, actors);
        return reply;
    }
};

TEST_F(ReplySetTest, Upsert_NewResponder_ShouldAddRecord) {
    ReplySet replies;

    EXPECT_TRUE(replies.upsert(make_reply("h1", 1)));
    EXPECT_TRUE(replies.upsert(make_reply("h2", 1)));

    EXPECT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies.duplicates(), 0u);
    EXPECT_TRUE(replies.contains("h1"));
}

TEST_F(ReplySetTest, Upsert_SameResponder_ShouldReplaceEarlierReply) {
    // Given a host that answered once with two actors
    ReplySet replies;
    replies.upsert(make_reply("h1", 2));

    // When a second reply from the same host arrives with five actors
    EXPECT_FALSE(replies.upsert(make_reply("h1", 5)));

    // Then only the later reply is kept
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies.records()[0].inventory.workloads.size(), 5u);
    EXPECT_EQ(replies.duplicates(), 1u);
}

TEST_F(ReplySetTest, Clear_ShouldForgetEverything) {
    ReplySet replies;
    replies.upsert(make_reply("h1", 1));
    replies.upsert(make_reply("h1", 1));

    replies.clear();

    EXPECT_TRUE(replies.empty());
    EXPECT_EQ(replies.duplicates(), 0u);
    EXPECT_FALSE(replies.contains("h1"));
}

// =============================================================================
// Aggregator Tests
// =============================================================================

class AggregatorTest : public ::testing::Test {
protected:
    ReplyRecord make_reply(const std::string& host, std::size_t actors) {
        ReplyRecord reply;
        reply.correlation_id = "corr-1";
        reply.responder = host;
        reply.inventory = inventory(host, actors);
        return reply;
    }
};

TEST_F(AggregatorTest, Aggregate_ThreeHostsOutOfOrder_ShouldSortAndCountWorkloads) {
    // Given h1, h3, h2 replying in that order with 2, 0 and 1 workloads
    std::vector<ReplyRecord> records = {
        make_reply("h1", 2),
        make_reply("h3", 0),
        make_reply("h2", 1),
    };

    // When aggregated
    auto snapshot = Aggregator().aggregate(records);

    // Then hosts are ordered by identity and the workload total is 3
    EXPECT_EQ(snapshot.host_ids(), (std::vector<std::string>{"h1", "h2", "h3"}));
    EXPECT_EQ(snapshot.total_workloads, 3u);
    EXPECT_EQ(snapshot.workload_counts.at("h1"), 2u);
    EXPECT_EQ(snapshot.workload_counts.at("h2"), 1u);
    EXPECT_EQ(snapshot.workload_counts.at("h3"), 0u);
    EXPECT_TRUE(snapshot.responded);
}

TEST_F(AggregatorTest, Aggregate_DuplicateIdentities_ShouldKeepLatestArrival) {
    std::vector<ReplyRecord> records = {
        make_reply("h2", 4),
        make_reply("h1", 1),
        make_reply("h2", 2),
    };

    auto snapshot = Aggregator().aggregate(records);

    ASSERT_EQ(snapshot.size(), 2u);
    ASSERT_NE(snapshot.find("h2"), nullptr);
    EXPECT_EQ(snapshot.find("h2")->workloads.size(), 2u);
    EXPECT_EQ(snapshot.total_workloads, 3u);
}

TEST_F(AggregatorTest, Aggregate_AnyArrivalOrder_ShouldProduceSameSnapshot) {
    std::vector<ReplyRecord> records = {
        make_reply("n-b", 1),
        make_reply("n-a", 3),
        make_reply("n-c", 0),
        make_reply("n-d", 2),
    };
    auto expected = Aggregator().aggregate(records).host_ids();

    std::sort(records.begin(), records.end(),
              [](const ReplyRecord& a, const ReplyRecord& b) { return a.responder < b.responder; });
    do {
        auto snapshot = Aggregator().aggregate(records);
        EXPECT_EQ(snapshot.host_ids(), expected);
        EXPECT_EQ(snapshot.total_workloads, 6u);
    } while (std::next_permutation(records.begin(), records.end(),
                                   [](const ReplyRecord& a, const ReplyRecord& b) {
                                       return a.responder < b.responder;
                                   }));
}

TEST_F(AggregatorTest, Aggregate_NoReplies_ShouldBeEmptyAndNotResponded) {
    auto snapshot = Aggregator().aggregate(std::vector<ReplyRecord>{});

    EXPECT_TRUE(snapshot.empty());
    EXPECT_FALSE(snapshot.responded);
    EXPECT_EQ(snapshot.total_workloads, 0u);
}

TEST_F(AggregatorTest, Aggregate_Links_ShouldCountLinkTotals) {
    auto reply = make_reply("h1", 0);
    reply.kind = InventoryKind::Links;
    reply.inventory.links = {binding_to("Ma", "wasmcloud:httpserver"), binding_to("Mb", "wasmcloud:keyvalue")};

    auto snapshot = Aggregator(InventoryKind::Links).aggregate(std::vector<ReplyRecord>{reply});

    EXPECT_EQ(snapshot.kind, InventoryKind::Links);
    EXPECT_EQ(snapshot.total_links, 2u);
}

TEST_F(AggregatorTest, Aggregate_ShouldUseResponderAsHostId) {
    auto reply = make_reply("h1", 1);
    reply.inventory.host_id = "something-else";

    auto snapshot = Aggregator().aggregate(std::vector<ReplyRecord>{reply});

    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.hosts[0].host_id, "h1");
}

TEST_F(AggregatorTest, Find_UnknownHost_ShouldReturnNull) {
    auto snapshot = Aggregator().aggregate(std::vector<ReplyRecord>{make_reply("h1", 1)});

    EXPECT_EQ(snapshot.find("h9"), nullptr);
}
