#include <gtest/gtest.h>
#include "core/ServerConfig.hpp"
#include <cstdlib>
#include <optional>
#include <string>

using namespace dg_mcp;

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* existing = std::getenv(ServerConfig::API_KEY_ENV);
        if (existing) {
            saved_key_ = existing;
        }
    }

    void TearDown() override {
        if (saved_key_) {
            setenv(ServerConfig::API_KEY_ENV, saved_key_->c_str(), 1);
        } else {
            unsetenv(ServerConfig::API_KEY_ENV);
        }
    }

    std::optional<std::string> saved_key_;
};

TEST_F(ServerConfigTest, ReadsKeyFromEnvironment) {
    setenv(ServerConfig::API_KEY_ENV, "secret-key", 1);

    ServerConfig config = ServerConfig::from_environment();

    EXPECT_EQ(config.api_key, "secret-key");
    EXPECT_EQ(config.api_url, "https://api.deepgram.com");
    EXPECT_EQ(config.model, "aura-asteria-en");
    EXPECT_EQ(config.timeout_seconds, 300);
}

TEST_F(ServerConfigTest, OverridesApplied) {
    setenv(ServerConfig::API_KEY_ENV, "k", 1);

    ServerConfig config = ServerConfig::from_environment("http://127.0.0.1:8080", "aura-luna-en", 30);

    EXPECT_EQ(config.api_url, "http://127.0.0.1:8080");
    EXPECT_EQ(config.model, "aura-luna-en");
    EXPECT_EQ(config.timeout_seconds, 30);
}

TEST_F(ServerConfigTest, MissingKeyIsFatal) {
    unsetenv(ServerConfig::API_KEY_ENV);

    try {
        ServerConfig::from_environment();
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "DEEPGRAM_API_KEY environment variable not set");
    }
}

TEST_F(ServerConfigTest, EmptyKeyIsFatal) {
    setenv(ServerConfig::API_KEY_ENV, "", 1);
    EXPECT_THROW(ServerConfig::from_environment(), std::runtime_error);
}

TEST_F(ServerConfigTest, InvalidSettingsRejected) {
    setenv(ServerConfig::API_KEY_ENV, "k", 1);
    EXPECT_THROW(ServerConfig::from_environment("", "aura-asteria-en", 10), std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_environment("https://api.deepgram.com", "aura-asteria-en", 0),
                 std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_environment("https://api.deepgram.com", "", 10),
                 std::invalid_argument);
}

TEST_F(ServerConfigTest, UrlWithPathRejected) {
    setenv(ServerConfig::API_KEY_ENV, "k", 1);

    try {
        ServerConfig::from_environment("https://proxy.example.com/dg", "aura-asteria-en", 10);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("https://proxy.example.com/dg"), std::string::npos);
    }
    EXPECT_THROW(ServerConfig::from_environment("https://proxy.example.com/v1/", "aura-asteria-en", 10),
                 std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_environment("https://api.deepgram.com?x=1", "aura-asteria-en", 10),
                 std::invalid_argument);
}

TEST_F(ServerConfigTest, UrlSchemeChecked) {
    EXPECT_THROW(ServerConfig::normalize_api_url("ftp://api.deepgram.com"), std::invalid_argument);
    EXPECT_THROW(ServerConfig::normalize_api_url("api.deepgram.com"), std::invalid_argument);
    EXPECT_THROW(ServerConfig::normalize_api_url("https://"), std::invalid_argument);
    EXPECT_THROW(ServerConfig::normalize_api_url("https:///"), std::invalid_argument);
}

TEST_F(ServerConfigTest, TrailingSlashStripped) {
    EXPECT_EQ(ServerConfig::normalize_api_url("https://api.deepgram.com/"), "https://api.deepgram.com");
    EXPECT_EQ(ServerConfig::normalize_api_url("http://127.0.0.1:8080"), "http://127.0.0.1:8080");
}
