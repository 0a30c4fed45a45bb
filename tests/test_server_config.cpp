#include "../include/ServerConfig.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief GAME_* 환경 변수를 테스트마다 초기화하는 Fixture.
 */
class ServerConfigTest : public ::testing::Test {
protected:
    const std::vector<std::string> vars_ = {
        "GAME_SERVER_PORT", "GAME_BIND_IP", "GAME_THREADS", "GAME_LOG_LEVEL",
        "GAME_HANDSHAKE_TIMEOUT_MS", "GAME_OVER_LINGER_MS",
        "GAME_ROOM_IDLE_TIMEOUT_MS", "GAME_ROOM_REAP_INTERVAL_MS"};

    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    void clear() {
        for (const auto& v : vars_) unsetenv(v.c_str());
    }
};

TEST_F(ServerConfigTest, DefaultsWhenNothingIsSet)
{
    ServerConfig config = load_server_config_from_env();
    EXPECT_EQ(config.port, 9999);
    EXPECT_EQ(config.bind_ip, "0.0.0.0");
    EXPECT_EQ(config.threads, 4);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.game_over_linger, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.handshake_timeout, std::chrono::milliseconds(10000));
}

TEST_F(ServerConfigTest, ReadsOverrides)
{
    setenv("GAME_SERVER_PORT", "12345", 1);
    setenv("GAME_BIND_IP", "127.0.0.1", 1);
    setenv("GAME_THREADS", "2", 1);
    setenv("GAME_OVER_LINGER_MS", "50", 1);
    setenv("GAME_ROOM_IDLE_TIMEOUT_MS", "2000", 1);

    ServerConfig config = load_server_config_from_env();
    EXPECT_EQ(config.port, 12345);
    EXPECT_EQ(config.bind_ip, "127.0.0.1");
    EXPECT_EQ(config.threads, 2);
    EXPECT_EQ(config.game_over_linger, std::chrono::milliseconds(50));
    EXPECT_EQ(config.room_idle_timeout, std::chrono::milliseconds(2000));
}

TEST_F(ServerConfigTest, RejectsInvalidPort)
{
    setenv("GAME_SERVER_PORT", "70000", 1);
    EXPECT_THROW(load_server_config_from_env(), std::runtime_error);
    setenv("GAME_SERVER_PORT", "abc", 1);
    EXPECT_THROW(load_server_config_from_env(), std::runtime_error);
}

TEST_F(ServerConfigTest, RejectsNonPositiveDurationsAndThreads)
{
    setenv("GAME_OVER_LINGER_MS", "0", 1);
    EXPECT_THROW(load_server_config_from_env(), std::runtime_error);
    unsetenv("GAME_OVER_LINGER_MS");

    setenv("GAME_THREADS", "-1", 1);
    EXPECT_THROW(load_server_config_from_env(), std::runtime_error);
}

TEST_F(ServerConfigTest, UnparsableIntegerFallsBackToDefault)
{
    setenv("GAME_THREADS", "many", 1);
    EXPECT_EQ(load_server_config_from_env().threads, 4);
}
