#include <gtest/gtest.h>
#include "server_config.hpp"
#include <cstdlib>

using namespace powgate;

class ServerConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"POWGATE_ADDR", "POWGATE_PORT", "POWGATE_THREADS", "POWGATE_MAX_BODY",
                                 "POWGATE_SECRET", "POWGATE_VERIFY_DIFFICULTY", "POWGATE_LOGIN_DIFFICULTY",
                                 "POWGATE_NONCE_LENGTH", "POWGATE_FAILURE_STATUS"}) {
            unsetenv(name);
        }
    }
};

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.max_message_size, 64u * 1024);
    EXPECT_EQ(config.verify_difficulty, 11);
    EXPECT_EQ(config.login_difficulty, 10);
    EXPECT_EQ(config.nonce_length, 10u);
    EXPECT_TRUE(config.secret.empty());
    EXPECT_EQ(config.failure_status_code, 428u);
}

TEST_F(ServerConfigEnvTest, NoEnvironmentKeepsDefaults) {
    ServerConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.verify_difficulty, 11);
}

TEST_F(ServerConfigEnvTest, OverridesApply) {
    setenv("POWGATE_ADDR", "127.0.0.1", 1);
    setenv("POWGATE_PORT", "9090", 1);
    setenv("POWGATE_THREADS", "4", 1);
    setenv("POWGATE_SECRET", "hunter2", 1);
    setenv("POWGATE_VERIFY_DIFFICULTY", "20", 1);
    setenv("POWGATE_LOGIN_DIFFICULTY", "0", 1);
    setenv("POWGATE_NONCE_LENGTH", "16", 1);
    setenv("POWGATE_FAILURE_STATUS", "403", 1);

    ServerConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.address, "127.0.0.1");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.thread_count, 4);
    EXPECT_EQ(config.secret, "hunter2");
    EXPECT_EQ(config.verify_difficulty, 20);
    EXPECT_EQ(config.login_difficulty, 0);
    EXPECT_EQ(config.nonce_length, 16u);
    EXPECT_EQ(config.failure_status_code, 403u);
}

TEST_F(ServerConfigEnvTest, RejectsNonNumericValues) {
    setenv("POWGATE_PORT", "http", 1);
    ServerConfig config;
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
}

TEST_F(ServerConfigEnvTest, RejectsTrailingGarbage) {
    setenv("POWGATE_VERIFY_DIFFICULTY", "12bits", 1);
    ServerConfig config;
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
}

TEST_F(ServerConfigEnvTest, RejectsOutOfRangeValues) {
    ServerConfig config;

    setenv("POWGATE_VERIFY_DIFFICULTY", "257", 1);
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
    unsetenv("POWGATE_VERIFY_DIFFICULTY");

    setenv("POWGATE_LOGIN_DIFFICULTY", "-1", 1);
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
    unsetenv("POWGATE_LOGIN_DIFFICULTY");

    setenv("POWGATE_PORT", "70000", 1);
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
    unsetenv("POWGATE_PORT");

    setenv("POWGATE_NONCE_LENGTH", "0", 1);
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
    unsetenv("POWGATE_NONCE_LENGTH");

    setenv("POWGATE_FAILURE_STATUS", "99", 1);
    EXPECT_THROW(apply_env_overrides(config), std::invalid_argument);
}
