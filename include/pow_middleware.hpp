#pragma once

#include <string>

#include "nonce_issuer.hpp"
#include "pow_options.hpp"
#include "request_context.hpp"
#include "verification.hpp"

namespace powgate {

enum class BodyFormat {
    Json,
    Xml,
    Unacceptable
};

// Picks the issuance body format from an Accept header. JSON wins ties and empty headers.
BodyFormat negotiate_body_format(const std::string& accept);

/**
 * Proof-of-work steps for a request pipeline.
 *
 * Each step takes the current RequestContext. A step that fails aborts the
 * context; the caller stops running later steps once `is_aborted()` is true.
 * Instances are immutable after construction and safe to share between threads.
 */
class PowMiddleware {
public:
    // Throws ConfigurationError.
    explicit PowMiddleware(PowOptions options);

    // Writes the nonce, difficulty and (when checking) checksum as a JSON or XML body.
    void handle_nonce_request(RequestContext& ctx) const;

    // Writes the nonce, difficulty and (when checking) checksum as response headers.
    void set_nonce_headers(RequestContext& ctx) const;

    // Generates a nonce and stashes it in the request store for later issuance steps.
    void generate_nonce(RequestContext& ctx) const;

    /**
     * Verifies the proof carried by the request.
     * @return true when the pipeline may continue, false when the request was aborted.
     * Malformed requests get 400, extraction failures 500, rejected proofs go
     * through the configured failure handler.
     */
    bool verify_request(RequestContext& ctx) const;

    const PowSettings& settings() const { return settings_; }
    int difficulty() const { return settings_.difficulty; }
    const VerificationEngine& engine() const { return engine_; }

private:
    struct CurrentNonce {
        std::string nonce;
        std::string checksum_hex;
    };

    PowSettings settings_;
    NonceIssuer issuer_;
    VerificationEngine engine_;

    // Stashed nonce if generate_nonce ran for this request, otherwise a fresh one.
    bool current_nonce(RequestContext& ctx, CurrentNonce& out) const;
};

}
