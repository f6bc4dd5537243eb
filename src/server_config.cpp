#include "server_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace powgate {

namespace {

long long parse_integer(const char* name, const char* value, long long min, long long max) {
    std::string text(value);
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + text);
    }
    if (consumed != text.size() || parsed < min || parsed > max) {
        throw std::invalid_argument(std::string(name) + " out of range: " + text);
    }
    return parsed;
}

}

void apply_env_overrides(ServerConfig& config) {
    if (const char* e = std::getenv("POWGATE_ADDR")) {
        config.address = e;
    }
    if (const char* e = std::getenv("POWGATE_PORT")) {
        config.port = static_cast<uint16_t>(parse_integer("POWGATE_PORT", e, 1, 65535));
    }
    if (const char* e = std::getenv("POWGATE_THREADS")) {
        config.thread_count = static_cast<int>(parse_integer("POWGATE_THREADS", e, 0, 1024));
    }
    if (const char* e = std::getenv("POWGATE_MAX_BODY")) {
        config.max_message_size = static_cast<size_t>(parse_integer("POWGATE_MAX_BODY", e, 1, 64LL * 1024 * 1024));
    }
    if (const char* e = std::getenv("POWGATE_SECRET")) {
        config.secret = e;
    }

    // Difficulty is in bits; a SHA-256 digest has 256 of them.
    if (const char* e = std::getenv("POWGATE_VERIFY_DIFFICULTY")) {
        config.verify_difficulty = static_cast<int>(parse_integer("POWGATE_VERIFY_DIFFICULTY", e, 0, 256));
    }
    if (const char* e = std::getenv("POWGATE_LOGIN_DIFFICULTY")) {
        config.login_difficulty = static_cast<int>(parse_integer("POWGATE_LOGIN_DIFFICULTY", e, 0, 256));
    }
    if (const char* e = std::getenv("POWGATE_NONCE_LENGTH")) {
        config.nonce_length = static_cast<size_t>(parse_integer("POWGATE_NONCE_LENGTH", e, 1, 1024));
    }
    if (const char* e = std::getenv("POWGATE_FAILURE_STATUS")) {
        config.failure_status_code = static_cast<unsigned>(parse_integer("POWGATE_FAILURE_STATUS", e, 100, 599));
    }
}

}
