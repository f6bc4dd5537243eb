#pragma once

#include <string>
#include <functional>
#include <cstddef>

#include "checksum.hpp"

namespace powgate {

struct IssuedNonce {
    std::string nonce;
    Bytes checksum; // empty unless checksum checking is enabled
};

// Replacement for the built-in nonce source. Receives the configured length.
using NonceGenerator = std::function<std::string(std::size_t)>;

class NonceIssuer {
public:
    NonceIssuer(std::size_t nonce_length,
                bool check,
                std::string secret,
                DigestFunction digest,
                NonceGenerator generator = nullptr);

    /**
     * Issues a fresh nonce and, when checking is enabled, its checksum.
     * Throws std::runtime_error if the entropy source fails or an overriding
     * generator returns a nonce of the wrong length.
     */
    IssuedNonce generate() const;

    // Random string over the URL-safe alphabet A-Za-z0-9_- drawn from the OpenSSL CSPRNG.
    static std::string random_string(std::size_t length);

    std::size_t nonce_length() const { return nonce_length_; }

private:
    std::size_t nonce_length_;
    bool check_;
    std::string secret_;
    DigestFunction digest_;
    NonceGenerator generator_;
};

}
