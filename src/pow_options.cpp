#include "pow_options.hpp"

namespace powgate {

namespace {

void default_if_empty(std::string& value, const char* fallback) {
    if (value.empty()) value = fallback;
}

}

VerificationPolicy PowSettings::policy() const {
    VerificationPolicy p;
    p.difficulty = difficulty;
    p.check = check;
    p.secret = secret;
    p.digest = digest;
    p.verify_digest = verify_digest;
    return p;
}

FailureHandler default_failure_handler(unsigned status) {
    return [status](RequestContext& ctx, const VerificationError& err) {
        ctx.abort_with_status(status, err.describe());
    };
}

PowSettings resolve_options(PowOptions options) {
    if (!options.extract_all && !options.extract_data) {
        throw ConfigurationError("extract_data function not declared");
    }
    if (options.difficulty < 0) {
        throw ConfigurationError("difficulty must not be negative, got " + std::to_string(options.difficulty));
    }
    if (options.failure_status_code != 0 &&
        (options.failure_status_code < 100 || options.failure_status_code > 599)) {
        throw ConfigurationError("failure status code out of range: " + std::to_string(options.failure_status_code));
    }

    PowSettings s;

    s.nonce_header = std::move(options.nonce_header);
    s.nonce_checksum_header = std::move(options.nonce_checksum_header);
    s.hash_difficulty_header = std::move(options.hash_difficulty_header);
    default_if_empty(s.nonce_header, "X-Nonce");
    default_if_empty(s.nonce_checksum_header, "X-Nonce-Checksum");
    default_if_empty(s.hash_difficulty_header, "X-Hash-Difficulty");

    if (options.extract_all) {
        s.extractor = std::make_shared<CombinedExtractor>(std::move(options.extract_all));
    } else {
        ExtractNonceFn extract_nonce = options.extract_nonce
            ? std::move(options.extract_nonce)
            : header_nonce_extractor(s.nonce_header, s.nonce_checksum_header);
        ExtractHashFn extract_hash = options.extract_hash
            ? std::move(options.extract_hash)
            : header_hash_extractor("X-Hash");
        s.extractor = std::make_shared<SplitExtractor>(
            std::move(extract_nonce), std::move(options.extract_data), std::move(extract_hash));
    }

    s.difficulty = options.difficulty;
    s.nonce_length = options.nonce_length == 0 ? DEFAULT_NONCE_LENGTH : options.nonce_length;
    s.check = options.check;
    s.secret = std::move(options.secret);
    if (s.check && s.secret.empty()) {
        try {
            s.secret = NonceIssuer::random_string(GENERATED_SECRET_LENGTH);
        } catch (const std::exception& e) {
            throw ConfigurationError(std::string("failed to generate checksum secret: ") + e.what());
        }
    }
    s.verify_digest = options.verify_digest;
    s.digest = options.digest ? std::move(options.digest) : DigestFunction(sha256_digest);
    s.nonce_generator = std::move(options.nonce_generator);

    s.nonce_context_key = std::move(options.nonce_context_key);
    s.nonce_checksum_context_key = std::move(options.nonce_checksum_context_key);
    s.hash_difficulty_context_key = std::move(options.hash_difficulty_context_key);
    default_if_empty(s.nonce_context_key, "nonce");
    default_if_empty(s.nonce_checksum_context_key, "nonceChecksum");
    default_if_empty(s.hash_difficulty_context_key, "hashDifficulty");

    s.nonce_data_key = std::move(options.nonce_data_key);
    s.nonce_checksum_data_key = std::move(options.nonce_checksum_data_key);
    s.hash_difficulty_data_key = std::move(options.hash_difficulty_data_key);
    default_if_empty(s.nonce_data_key, "nonce");
    default_if_empty(s.nonce_checksum_data_key, "nonce_checksum");
    default_if_empty(s.hash_difficulty_data_key, "difficulty");

    s.failure_status_code = options.failure_status_code == 0 ? DEFAULT_FAILURE_STATUS : options.failure_status_code;
    s.on_failed_verification = options.on_failed_verification
        ? std::move(options.on_failed_verification)
        : default_failure_handler(s.failure_status_code);

    return s;
}

}
