#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace powgate {

// Demo server configuration. Defaults are overridden by the CLI port argument
// and POWGATE_* environment variables.
struct ServerConfig {
    // --- Network ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Connection & Resource Management ---
    size_t max_message_size = 64 * 1024;
    int connection_timeout_sec = 60;

    // --- Proof-of-Work ---
    int verify_difficulty = 11;   // /hash/verify, checksum checking enabled
    int login_difficulty = 10;    // /login, no checksum
    size_t nonce_length = 10;
    std::string secret = "";      // empty: random per process, issued nonces die with it
    unsigned failure_status_code = 428;
};

/**
 * Applies POWGATE_ADDR, POWGATE_PORT, POWGATE_THREADS, POWGATE_MAX_BODY,
 * POWGATE_SECRET, POWGATE_VERIFY_DIFFICULTY, POWGATE_LOGIN_DIFFICULTY,
 * POWGATE_NONCE_LENGTH and POWGATE_FAILURE_STATUS.
 * Throws std::invalid_argument for values that do not parse.
 */
void apply_env_overrides(ServerConfig& config);

}
