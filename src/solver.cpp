#include "solver.hpp"
#include "difficulty.hpp"
#include "input_validator.hpp"

namespace powgate {

std::optional<Solution> solve(const std::string& nonce,
                              const std::string& data_prefix,
                              int difficulty,
                              uint64_t max_attempts,
                              const DigestFunction& digest) {
    for (uint64_t i = 0; i < max_attempts; ++i) {
        std::string data = data_prefix + std::to_string(i);
        Bytes hash = proof_digest(nonce, data, digest);
        if (DifficultyEvaluator::meets_difficulty(hash, difficulty)) {
            Solution s;
            s.counter = i;
            s.data = std::move(data);
            s.hash_hex = InputValidator::hex_encode(hash);
            s.attempts = i + 1;
            return s;
        }
    }
    return std::nullopt;
}

}
