#include "verification.hpp"
#include "difficulty.hpp"
#include "input_validator.hpp"

#include <openssl/crypto.h>
#include <sstream>

namespace powgate {

namespace {

VerificationResult malformed(const std::string& message) {
    VerificationResult result;
    result.outcome = Outcome::MalformedRequest;
    result.message = message;
    return result;
}

}

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Accepted: return "accepted";
        case Outcome::MalformedRequest: return "malformed_request";
        case Outcome::ExtractionFailed: return "extraction_failed";
        case Outcome::ChecksumInvalid: return "checksum_invalid";
        case Outcome::DifficultyNotMet: return "difficulty_not_met";
        default: return "unknown";
    }
}

std::string VerificationError::describe() const {
    std::stringstream ss;
    ss << reason
       << " (hash=" << hash
       << ", nonce=" << nonce
       << ", nonce_checksum=" << nonce_checksum
       << ", difficulty=" << difficulty << ")";
    return ss.str();
}

VerificationEngine::VerificationEngine(VerificationPolicy policy, std::shared_ptr<const Extractor> extractor)
    : policy_(std::move(policy))
    , extractor_(std::move(extractor))
{}

VerificationResult VerificationEngine::verify(RequestContext& ctx) const {
    Extraction fields;
    try {
        fields = extractor_->extract(ctx);
    } catch (const std::exception& e) {
        VerificationResult result;
        result.outcome = Outcome::ExtractionFailed;
        result.message = e.what();
        return result;
    }
    return evaluate(fields);
}

VerificationResult VerificationEngine::evaluate(const Extraction& fields) const {
    // Structural checks
    if (fields.nonce.empty()) {
        return malformed("no nonce in request");
    }
    if (policy_.check && fields.nonce_checksum.empty()) {
        return malformed("no nonce checksum in request");
    }
    if (fields.hash.empty()) {
        return malformed("no hash in request");
    }

    // Decoding
    Bytes hash;
    if (!InputValidator::hex_decode(fields.hash, hash)) {
        return malformed("received hash is not a valid hex string");
    }
    Bytes checksum;
    if (!InputValidator::hex_decode(fields.nonce_checksum, checksum)) {
        return malformed("received checksum is not a valid hex string");
    }

    if (policy_.check && !ChecksumEngine::verify(policy_.secret, fields.nonce, checksum, policy_.digest)) {
        return rejected(Outcome::ChecksumInvalid, fields, "invalid nonce checksum");
    }

    if (!DifficultyEvaluator::meets_difficulty(hash, policy_.difficulty)) {
        return rejected(Outcome::DifficultyNotMet, fields, "hash does not meet difficulty");
    }

    if (policy_.verify_digest) {
        Bytes expected = proof_digest(fields.nonce, fields.data, policy_.digest);
        if (expected.size() != hash.size() ||
            CRYPTO_memcmp(expected.data(), hash.data(), hash.size()) != 0) {
            return rejected(Outcome::DifficultyNotMet, fields, "hash does not match nonce and data");
        }
    }

    return VerificationResult{};
}

VerificationResult VerificationEngine::rejected(Outcome outcome, const Extraction& fields, const std::string& reason) const {
    VerificationResult result;
    result.outcome = outcome;
    result.message = reason;
    result.error = VerificationError{fields.hash, fields.nonce, fields.nonce_checksum, policy_.difficulty, reason};
    return result;
}

}
