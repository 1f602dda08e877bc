#include <gtest/gtest.h>
#include "server_config.hpp"
#include <cstdlib>

using namespace keydir;

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_TRUE(config.enable_tls);
    EXPECT_FALSE(config.use_memory_store);
    EXPECT_EQ(config.max_message_size, 64u * 1024u);
    EXPECT_EQ(config.replenish_threshold, 20u);
    EXPECT_EQ(config.max_one_time_pre_keys_per_upload, 100u);
    EXPECT_EQ(config.identity_header, "X-User-Id");
    EXPECT_EQ(config.secret_salt, kDefaultSecretSalt);
    EXPECT_TRUE(config.admin_token.empty());
}

class ServerConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"KEYDIR_PORT", "KEYDIR_REDIS_URL", "KEYDIR_MEMORY_STORE",
                                 "KEYDIR_REPLENISH_THRESHOLD", "KEYDIR_ALLOWED_ORIGINS",
                                 "KEYDIR_SECRET_SALT", "KEYDIR_TLS", "KEYDIR_STORAGE_TIMEOUT_MS"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ServerConfigEnvTest, AppliesOverrides) {
    setenv("KEYDIR_PORT", "9443", 1);
    setenv("KEYDIR_REDIS_URL", "tcp://redis.internal:6380", 1);
    setenv("KEYDIR_MEMORY_STORE", "1", 1);
    setenv("KEYDIR_REPLENISH_THRESHOLD", "50", 1);
    setenv("KEYDIR_SECRET_SALT", "deployment-specific", 1);
    setenv("KEYDIR_TLS", "0", 1);
    setenv("KEYDIR_STORAGE_TIMEOUT_MS", "250", 1);

    ServerConfig config;
    apply_env_overrides(config);

    EXPECT_EQ(config.port, 9443);
    EXPECT_EQ(config.redis_url, "tcp://redis.internal:6380");
    EXPECT_TRUE(config.use_memory_store);
    EXPECT_EQ(config.replenish_threshold, 50u);
    EXPECT_EQ(config.secret_salt, "deployment-specific");
    EXPECT_FALSE(config.enable_tls);
    EXPECT_EQ(config.storage_timeout_ms, 250);
}

TEST_F(ServerConfigEnvTest, SplitsAllowedOrigins) {
    setenv("KEYDIR_ALLOWED_ORIGINS", "https://a.example,https://b.example", 1);

    ServerConfig config;
    apply_env_overrides(config);

    ASSERT_EQ(config.allowed_origins.size(), 2u);
    EXPECT_EQ(config.allowed_origins[0], "https://a.example");
    EXPECT_EQ(config.allowed_origins[1], "https://b.example");
}

TEST_F(ServerConfigEnvTest, MalformedNumberThrows) {
    setenv("KEYDIR_PORT", "not-a-port", 1);
    ServerConfig config;
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
}

TEST_F(ServerConfigEnvTest, UnsetVariablesKeepDefaults) {
    ServerConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.redis_url, "tcp://127.0.0.1:6379");
}
