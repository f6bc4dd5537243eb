#pragma once

#include <memory>
#include <optional>
#include <string>

#include "checksum.hpp"
#include "extractors.hpp"
#include "request_context.hpp"

namespace powgate {

enum class Outcome {
    Accepted,
    MalformedRequest,
    ExtractionFailed,
    ChecksumInvalid,
    DifficultyNotMet
};

const char* outcome_name(Outcome outcome);

// Parameters of a rejected proof. Deliberately excludes the request data.
struct VerificationError {
    std::string hash;
    std::string nonce;
    std::string nonce_checksum;
    int difficulty = 0;
    std::string reason;

    const std::string& what() const { return reason; }

    // "<reason> (hash=..., nonce=..., nonce_checksum=..., difficulty=N)"
    std::string describe() const;
};

struct VerificationResult {
    Outcome outcome = Outcome::Accepted;
    std::string message;                     // diagnostic for malformed and extraction failures
    std::optional<VerificationError> error;  // set for ChecksumInvalid and DifficultyNotMet

    bool accepted() const { return outcome == Outcome::Accepted; }
};

struct VerificationPolicy {
    int difficulty = 0;
    bool check = false;
    std::string secret;
    DigestFunction digest = sha256_digest;
    bool verify_digest = false;
};

/**
 * Classifies a request as accepted, malformed, or failed-proof.
 *
 * Stages run strictly in order and stop at the first failure:
 * extraction, structural checks, hex decoding, checksum, difficulty.
 * The engine never writes to the response; reporting is left to the caller.
 */
class VerificationEngine {
public:
    VerificationEngine(VerificationPolicy policy, std::shared_ptr<const Extractor> extractor);

    VerificationResult verify(RequestContext& ctx) const;

    // Stages after extraction, for fields already read from a request.
    VerificationResult evaluate(const Extraction& fields) const;

    const VerificationPolicy& policy() const { return policy_; }

private:
    VerificationPolicy policy_;
    std::shared_ptr<const Extractor> extractor_;

    VerificationResult rejected(Outcome outcome, const Extraction& fields, const std::string& reason) const;
};

}
