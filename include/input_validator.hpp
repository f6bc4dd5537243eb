#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <vector>
#include <iomanip>
#include <sstream>
#include <boost/json.hpp>

namespace powgate {

using Bytes = std::vector<unsigned char>;

// Wire-format validation and hex codec for proof-of-work fields.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    /**
     * Decodes a hex string into raw bytes.
     * Accepts both cases. Odd lengths and non-hex characters are rejected and leave
     * `out` untouched. An empty string decodes to an empty buffer.
     */
    static bool hex_decode(const std::string& str, Bytes& out) {
        if (str.size() % 2 != 0) return false;
        if (!str.empty() && !is_valid_hex(str)) return false;

        Bytes decoded;
        decoded.reserve(str.size() / 2);
        for (size_t i = 0; i < str.size(); i += 2) {
            decoded.push_back(static_cast<unsigned char>((nibble(str[i]) << 4) | nibble(str[i + 1])));
        }
        out.swap(decoded);
        return true;
    }

    // Canonical lower-case hex encoding.
    static std::string hex_encode(const Bytes& bytes) {
        std::stringstream ss;
        for (unsigned char b : bytes) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        return ss.str();
    }

    /**
     * JSON parsing with recursion depth limits to prevent stack-exhaustion (DoS).
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    }
};

}
