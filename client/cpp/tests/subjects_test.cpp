#include <gtest/gtest.h>
#include "lattice/subjects.hpp"

using namespace lattice;

// =============================================================================
// Subject construction
// =============================================================================

TEST(SubjectsTest, Inventory_ShouldEncodeKindAndScope) {
    EXPECT_EQ(subjects::inventory("", InventoryKind::Hosts, Scope::all()), "wasmbus.inventory.hosts");
    EXPECT_EQ(subjects::inventory("", InventoryKind::Workloads, Scope::host("N1")),
              "wasmbus.inventory.workloads.host.N1");
    EXPECT_EQ(subjects::inventory("", InventoryKind::Links, Scope::workload("M1")),
              "wasmbus.inventory.links.workload.M1");
}

TEST(SubjectsTest, Namespace_ShouldBeInsertedAfterRoot) {
    EXPECT_EQ(subjects::prefix(""), "wasmbus");
    EXPECT_EQ(subjects::prefix("prod"), "wasmbus.prod");
    EXPECT_EQ(subjects::inventory("prod", InventoryKind::Capabilities, Scope::all()),
              "wasmbus.prod.inventory.capabilities");
    EXPECT_EQ(subjects::events("prod"), "wasmbus.prod.events");
}

TEST(SubjectsTest, ControlSubjects_ShouldTargetHost) {
    EXPECT_EQ(subjects::auction(""), "wasmbus.control.auction.request");
    EXPECT_EQ(subjects::launch_actor("", "N1"), "wasmbus.control.N1.actor.launch");
    EXPECT_EQ(subjects::terminate_actor("", "N1"), "wasmbus.control.N1.actor.terminate");
}

TEST(SubjectsTest, RequestSubject_ShouldRouteAuctionsToControl) {
    QueryRequest request;
    request.kind = InventoryKind::Auction;
    request.scope = Scope::workload("M1");
    EXPECT_EQ(subjects::request_subject("", request), "wasmbus.control.auction.request");

    request.kind = InventoryKind::Hosts;
    request.scope = Scope::host("N1");
    EXPECT_EQ(subjects::request_subject("", request), "wasmbus.inventory.hosts.host.N1");
}

TEST(SubjectsTest, ReplyInbox_ShouldBeUniquePerCorrelation) {
    EXPECT_EQ(subjects::reply_inbox("abc"), "_INBOX.abc");
    EXPECT_NE(subjects::reply_inbox("abc"), subjects::reply_inbox("abd"));
}

// =============================================================================
// Wildcard matching
// =============================================================================

TEST(SubjectMatchTest, Literal_ShouldMatchExactly) {
    EXPECT_TRUE(subjects::matches("wasmbus.events", "wasmbus.events"));
    EXPECT_FALSE(subjects::matches("wasmbus.events", "wasmbus.events.x"));
    EXPECT_FALSE(subjects::matches("wasmbus.events.x", "wasmbus.events"));
}

TEST(SubjectMatchTest, Star_ShouldMatchExactlyOneToken) {
    EXPECT_TRUE(subjects::matches("wasmbus.*.hosts", "wasmbus.inventory.hosts"));
    EXPECT_FALSE(subjects::matches("wasmbus.*", "wasmbus.inventory.hosts"));
    EXPECT_FALSE(subjects::matches("wasmbus.*", "wasmbus"));
}

TEST(SubjectMatchTest, Tail_ShouldMatchOneOrMoreTokens) {
    EXPECT_TRUE(subjects::matches("wasmbus.>", "wasmbus.inventory"));
    EXPECT_TRUE(subjects::matches("wasmbus.>", "wasmbus.inventory.hosts.host.N1"));
    EXPECT_FALSE(subjects::matches("wasmbus.>", "wasmbus"));
    EXPECT_FALSE(subjects::matches("wasmbus.>.hosts", "wasmbus.inventory.hosts"));
}

TEST(SubjectMatchTest, InventoryPattern_ShouldNotMatchInboxes) {
    EXPECT_FALSE(subjects::matches("wasmbus.>", "_INBOX.abc"));
    EXPECT_TRUE(subjects::matches("_INBOX.abc", "_INBOX.abc"));
    EXPECT_FALSE(subjects::matches("_INBOX.abc", "_INBOX.abcd"));
}

// =============================================================================
// Token validation
// =============================================================================

TEST(SubjectTokenTest, IsValidToken_ShouldRejectSeparatorsAndWildcards) {
    EXPECT_TRUE(subjects::is_valid_token("NCE7YHGI42RWEKBRDJZW"));
    EXPECT_TRUE(subjects::is_valid_token("9b2f6a1e-3c4d-4e5f-8a9b-0c1d2e3f4a5b"));
    EXPECT_FALSE(subjects::is_valid_token(""));
    EXPECT_FALSE(subjects::is_valid_token("a.b"));
    EXPECT_FALSE(subjects::is_valid_token("*"));
    EXPECT_FALSE(subjects::is_valid_token("a>"));
    EXPECT_FALSE(subjects::is_valid_token("a b"));
    EXPECT_FALSE(subjects::is_valid_token("a\tb"));
}
