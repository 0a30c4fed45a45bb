#include "ServerConfig.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>   // getenv
#include <optional>
#include <stdexcept> // runtime_error
#include <string>

namespace {

/// 변수가 설정되어 있으면 그 값을, 아니면 nullopt를 돌려준다.
std::optional<std::string> read_env(const std::string& var_name) {
    const char* raw = std::getenv(var_name.c_str());
    if (raw == nullptr) {
        return std::nullopt;
    }
    return std::string(raw);
}

/// 문자열 전체가 정수여야 한다. "12abc" 같은 값도 실패로 본다.
std::optional<int> parse_int(const std::string& text, std::string& error) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            error = "trailing characters";
            return std::nullopt;
        }
        return value;
    }
    catch (const std::invalid_argument&) {
        error = "not a number";
    }
    catch (const std::out_of_range&) {
        error = "out of integer range";
    }
    return std::nullopt;
}

std::chrono::milliseconds get_positive_ms_env_var(const std::string& var_name, std::chrono::milliseconds default_value) {
    int value = get_int_env_var(var_name, static_cast<int>(default_value.count()));
    if (value <= 0) {
        throw std::runtime_error(fmt::format("Environment variable '{}' must be a positive number of milliseconds.", var_name));
    }
    return std::chrono::milliseconds(value);
}

} // namespace

unsigned short get_required_port_env_var(const std::string& var_name, unsigned short default_port) {
    auto raw = read_env(var_name);
    if (!raw) {
        std::fprintf(stdout, "%s not set, using default port %hu\n", var_name.c_str(), default_port);
        return default_port;
    }
    std::string error;
    auto port = parse_int(*raw, error);
    if (!port) {
        throw std::runtime_error(fmt::format("Invalid port in {}='{}': {}", var_name, *raw, error));
    }
    if (*port < 1 || *port > 65535) {
        throw std::runtime_error(fmt::format("Port in {}='{}' is outside 1-65535", var_name, *raw));
    }
    std::fprintf(stdout, "%s=%d\n", var_name.c_str(), *port);
    return static_cast<unsigned short>(*port);
}

std::string get_env_var(const std::string& var_name, const std::string& default_value) {
    auto raw = read_env(var_name);
    if (!raw) {
        std::fprintf(stdout, "%s not set, using default '%s'\n", var_name.c_str(), default_value.c_str());
        return default_value;
    }
    std::fprintf(stdout, "%s='%s'\n", var_name.c_str(), raw->c_str());
    return *raw;
}

int get_int_env_var(const std::string& var_name, int default_value) {
    auto raw = read_env(var_name);
    if (!raw) {
        std::fprintf(stdout, "%s not set, using default %d\n", var_name.c_str(), default_value);
        return default_value;
    }
    std::string error;
    auto value = parse_int(*raw, error);
    if (!value) {
        std::fprintf(stderr, "Warning: %s='%s' is not an integer (%s), using default %d\n",
                     var_name.c_str(), raw->c_str(), error.c_str(), default_value);
        return default_value;
    }
    std::fprintf(stdout, "%s=%d\n", var_name.c_str(), *value);
    return *value;
}

ServerConfig load_server_config_from_env() {
    ServerConfig config;
    config.port = get_required_port_env_var("GAME_SERVER_PORT", config.port);
    config.bind_ip = get_env_var("GAME_BIND_IP", config.bind_ip);
    config.threads = get_int_env_var("GAME_THREADS", config.threads);
    if (config.threads <= 0) {
        throw std::runtime_error("Environment variable 'GAME_THREADS' must be positive.");
    }
    config.log_level = get_env_var("GAME_LOG_LEVEL", config.log_level);
    config.handshake_timeout = get_positive_ms_env_var("GAME_HANDSHAKE_TIMEOUT_MS", config.handshake_timeout);
    config.game_over_linger = get_positive_ms_env_var("GAME_OVER_LINGER_MS", config.game_over_linger);
    config.room_idle_timeout = get_positive_ms_env_var("GAME_ROOM_IDLE_TIMEOUT_MS", config.room_idle_timeout);
    config.room_reap_interval = get_positive_ms_env_var("GAME_ROOM_REAP_INTERVAL_MS", config.room_reap_interval);
    return config;
}
