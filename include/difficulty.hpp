#pragma once

#include "input_validator.hpp"

namespace powgate {

// Difficulty is measured in leading zero bits, not hex characters.
class DifficultyEvaluator {
public:
    // Counts zero bits from the most significant bit of the first byte up to the first set bit.
    static int leading_zero_bits(const Bytes& hash) {
        int zeros = 0;
        for (unsigned char byte : hash) {
            if (byte == 0) {
                zeros += 8;
                continue;
            }
            for (unsigned char mask = 0x80; (byte & mask) == 0; mask >>= 1) {
                ++zeros;
            }
            break;
        }
        return zeros;
    }

    // Difficulty 0 (or below) accepts any hash.
    static bool meets_difficulty(const Bytes& hash, int difficulty) {
        if (difficulty <= 0) return true;
        return leading_zero_bits(hash) >= difficulty;
    }
};

}
