#include "nonce_issuer.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace powgate {

namespace {
constexpr char NONCE_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";
}

NonceIssuer::NonceIssuer(std::size_t nonce_length,
                         bool check,
                         std::string secret,
                         DigestFunction digest,
                         NonceGenerator generator)
    : nonce_length_(nonce_length)
    , check_(check)
    , secret_(std::move(secret))
    , digest_(std::move(digest))
    , generator_(std::move(generator))
{}

// The alphabet has exactly 64 symbols, so masking a random byte keeps the draw unbiased.
std::string NonceIssuer::random_string(std::size_t length) {
    std::vector<unsigned char> buffer(length);
    if (length > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
    }

    std::string out;
    out.reserve(length);
    for (unsigned char b : buffer) {
        out += NONCE_ALPHABET[b & 0x3F];
    }
    return out;
}

IssuedNonce NonceIssuer::generate() const {
    IssuedNonce issued;
    if (generator_) {
        issued.nonce = generator_(nonce_length_);
        if (issued.nonce.size() != nonce_length_) {
            throw std::runtime_error("nonce generator returned " + std::to_string(issued.nonce.size()) +
                                     " characters, expected " + std::to_string(nonce_length_));
        }
    } else {
        issued.nonce = random_string(nonce_length_);
    }

    if (check_) {
        issued.checksum = ChecksumEngine::compute(secret_, issued.nonce, digest_);
    }
    return issued;
}

}
