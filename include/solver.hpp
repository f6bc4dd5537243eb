#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "checksum.hpp"

namespace powgate {

struct Solution {
    uint64_t counter = 0;
    std::string data;      // data_prefix + counter
    std::string hash_hex;  // Digest(data || nonce)
    uint64_t attempts = 0;
};

/**
 * Client side of the protocol: searches counters 0..max_attempts-1 for data
 * `data_prefix + counter` whose proof digest with `nonce` reaches `difficulty`
 * leading zero bits.
 */
std::optional<Solution> solve(const std::string& nonce,
                              const std::string& data_prefix,
                              int difficulty,
                              uint64_t max_attempts = 10000000,
                              const DigestFunction& digest = sha256_digest);

}
