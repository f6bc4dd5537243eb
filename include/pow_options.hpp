#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "checksum.hpp"
#include "extractors.hpp"
#include "nonce_issuer.hpp"
#include "request_context.hpp"
#include "verification.hpp"

namespace powgate {

// Decides the client-visible response for a rejected proof.
using FailureHandler = std::function<void(RequestContext&, const VerificationError&)>;

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Integrator-facing options. Zero or empty values mean "use the default".
// Either extract_all or extract_data is required.
struct PowOptions {
    // --- Issuance headers ---
    std::string nonce_header;            // X-Nonce
    std::string nonce_checksum_header;   // X-Nonce-Checksum
    std::string hash_difficulty_header;  // X-Hash-Difficulty

    // --- Extraction ---
    ExtractAllFn extract_all;      // when set, the split extractors are ignored
    ExtractDataFn extract_data;
    ExtractNonceFn extract_nonce;  // defaults to the nonce and checksum headers
    ExtractHashFn extract_hash;    // defaults to the X-Hash header

    // --- Proof parameters ---
    int difficulty = 0;
    std::size_t nonce_length = 0;  // 10
    bool check = false;
    std::string secret;            // 32 random characters when check is set
    bool verify_digest = false;    // also require hash == Digest(data || nonce)
    DigestFunction digest;         // SHA-256
    NonceGenerator nonce_generator;

    // --- Request-scoped store keys ---
    std::string nonce_context_key;            // nonce
    std::string nonce_checksum_context_key;   // nonceChecksum
    std::string hash_difficulty_context_key;  // hashDifficulty

    // --- Issuance body keys ---
    std::string nonce_data_key;            // nonce
    std::string nonce_checksum_data_key;   // nonce_checksum
    std::string hash_difficulty_data_key;  // difficulty

    // --- Failure reporting ---
    unsigned failure_status_code = 0;  // 428
    FailureHandler on_failed_verification;
};

// Fully resolved, immutable configuration of one middleware instance.
struct PowSettings {
    std::string nonce_header;
    std::string nonce_checksum_header;
    std::string hash_difficulty_header;

    std::shared_ptr<const Extractor> extractor;

    int difficulty = 0;
    std::size_t nonce_length = 0;
    bool check = false;
    std::string secret;
    bool verify_digest = false;
    DigestFunction digest;
    NonceGenerator nonce_generator;

    std::string nonce_context_key;
    std::string nonce_checksum_context_key;
    std::string hash_difficulty_context_key;

    std::string nonce_data_key;
    std::string nonce_checksum_data_key;
    std::string hash_difficulty_data_key;

    unsigned failure_status_code = 0;
    FailureHandler on_failed_verification;

    VerificationPolicy policy() const;
};

constexpr std::size_t DEFAULT_NONCE_LENGTH = 10;
constexpr std::size_t GENERATED_SECRET_LENGTH = 32;
constexpr unsigned DEFAULT_FAILURE_STATUS = 428;

/**
 * Fills every unset option with its default.
 * Throws ConfigurationError when no data extractor is given, the difficulty is
 * negative, or the failure status is not a valid HTTP status.
 */
PowSettings resolve_options(PowOptions options);

// Aborts with `status` and a body built from the error fields.
FailureHandler default_failure_handler(unsigned status);

}
