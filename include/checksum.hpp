#pragma once

#include <string>
#include <functional>
#include <openssl/sha.h>
#include <openssl/crypto.h>

#include "input_validator.hpp"

namespace powgate {

// Digest used both for nonce checksums and for proof reconstruction.
using DigestFunction = std::function<Bytes(const std::string&)>;

inline Bytes sha256_digest(const std::string& input) {
    Bytes out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), out.data());
    return out;
}

// Proof input order is data || nonce.
inline Bytes proof_digest(const std::string& nonce, const std::string& data, const DigestFunction& digest = sha256_digest) {
    return digest(data + nonce);
}

// Keyed integrity tag binding a nonce to the server secret.
// Lets the server recognise its own nonces without keeping a nonce store.
class ChecksumEngine {
public:
    /**
     * Computes Digest(nonce || secret).
     * @param secret Process-wide checksum key.
     * @param nonce The issued nonce.
     * @param digest Digest function, SHA-256 unless overridden.
     */
    static Bytes compute(const std::string& secret, const std::string& nonce,
                         const DigestFunction& digest = sha256_digest) {
        return digest(nonce + secret);
    }

    // Recomputes the checksum and compares it in constant time.
    static bool verify(const std::string& secret, const std::string& nonce, const Bytes& checksum,
                       const DigestFunction& digest = sha256_digest) {
        Bytes expected = compute(secret, nonce, digest);
        if (expected.size() != checksum.size() || expected.empty()) return false;
        return CRYPTO_memcmp(expected.data(), checksum.data(), expected.size()) == 0;
    }
};

}
