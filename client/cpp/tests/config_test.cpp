#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include "lattice/config.hpp"
#include "lattice/errors.hpp"
#include "lattice/logging.hpp"

using namespace lattice;

class ClientConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    void clear() {
        unsetenv("LATTICE_HOST");
        unsetenv("LATTICE_CREDS_FILE");
        unsetenv("LATTICE_RPC_TIMEOUT_MILLIS");
        unsetenv("LATTICE_NAMESPACE");
    }
};

TEST_F(ClientConfigTest, FromEnv_NothingSet_ShouldUseDefaults) {
    auto config = ClientConfig::from_env();

    EXPECT_EQ(config.endpoint, "127.0.0.1:4222");
    EXPECT_FALSE(config.creds_file.has_value());
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(600));
    EXPECT_TRUE(config.lattice_namespace.empty());
    EXPECT_EQ(config.max_payload_bytes, 1024u * 1024u);
}

TEST_F(ClientConfigTest, FromEnv_AllSet_ShouldOverrideDefaults) {
    setenv("LATTICE_HOST", "http://gateway.local:9000", 1);
    setenv("LATTICE_CREDS_FILE", "/etc/lattice/token", 1);
    setenv("LATTICE_RPC_TIMEOUT_MILLIS", "1500", 1);
    setenv("LATTICE_NAMESPACE", "prod", 1);

    auto config = ClientConfig::from_env();

    EXPECT_EQ(config.endpoint, "gateway.local:9000");
    ASSERT_TRUE(config.creds_file.has_value());
    EXPECT_EQ(*config.creds_file, "/etc/lattice/token");
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.lattice_namespace, "prod");
}

TEST_F(ClientConfigTest, FromEnv_BadTimeout_ShouldThrowInvalidArgument) {
    for (const char* value : {"abc", "0", "-20", "15ms"}) {
        setenv("LATTICE_RPC_TIMEOUT_MILLIS", value, 1);
        EXPECT_THROW(ClientConfig::from_env(), InvalidArgumentError) << value;
    }
}

TEST_F(ClientConfigTest, FromEnv_NamespaceWithSeparator_ShouldThrowInvalidArgument) {
    setenv("LATTICE_NAMESPACE", "a.b", 1);

    EXPECT_THROW(ClientConfig::from_env(), InvalidArgumentError);
}

TEST_F(ClientConfigTest, ParseTimeout_ShouldAcceptPositiveMillis) {
    EXPECT_EQ(ClientConfig::parse_timeout("2500", "--timeout"), std::chrono::milliseconds(2500));
}

TEST_F(ClientConfigTest, ParseTimeout_BadValue_ShouldNameTheSetting) {
    for (const char* value : {"abc", "", "0", "-1", "10s", "99999999999999999999"}) {
        try {
            ClientConfig::parse_timeout(value, "--timeout");
            FAIL() << "accepted " << value;
        } catch (const InvalidArgumentError& e) {
            EXPECT_EQ(std::string(e.what()), std::string("--timeout must be a positive integer: ") + value);
        }
    }
}

TEST_F(ClientConfigTest, FormatEndpoint_ShouldStripScheme) {
    EXPECT_EQ(ClientConfig::format_endpoint("https://host:443"), "host:443");
    EXPECT_EQ(ClientConfig::format_endpoint("host:4222"), "host:4222");
}

// =============================================================================
// Log level
// =============================================================================

TEST(LogLevelTest, Parse_ShouldAcceptNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("loud", LogLevel::Info), LogLevel::Info);
}

TEST(LogLevelTest, SetLogLevel_ShouldChangeThreshold) {
    auto previous = log_level();

    set_log_level(LogLevel::Error);
    EXPECT_EQ(log_level(), LogLevel::Error);

    set_log_level(previous);
}
