#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <boost/json.hpp>

#include "request_context.hpp"

namespace powgate {

// Raw proof-of-work fields read from a request. All values are still wire encoded.
struct Extraction {
    std::string nonce;
    std::string nonce_checksum;
    std::string data;
    std::string hash;
};

struct NonceFields {
    std::string nonce;
    std::string nonce_checksum;
};

// Extractors report failure by throwing. An extractor may also abort the
// context with its own response before throwing; that response is kept.
using ExtractAllFn = std::function<Extraction(RequestContext&)>;
using ExtractNonceFn = std::function<NonceFields(RequestContext&)>;
using ExtractDataFn = std::function<std::string(RequestContext&)>;
using ExtractHashFn = std::function<std::string(RequestContext&)>;

class ExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Extractor {
public:
    virtual ~Extractor() = default;
    virtual Extraction extract(RequestContext& ctx) const = 0;
};

// Reads every field with a single integrator-supplied function.
class CombinedExtractor final : public Extractor {
public:
    explicit CombinedExtractor(ExtractAllFn extract_all);
    Extraction extract(RequestContext& ctx) const override;

private:
    ExtractAllFn extract_all_;
};

// Reads nonce+checksum, data and hash with three separate functions, in that order.
class SplitExtractor final : public Extractor {
public:
    SplitExtractor(ExtractNonceFn extract_nonce, ExtractDataFn extract_data, ExtractHashFn extract_hash);
    Extraction extract(RequestContext& ctx) const override;

private:
    ExtractNonceFn extract_nonce_;
    ExtractDataFn extract_data_;
    ExtractHashFn extract_hash_;
};

// Nonce and checksum from request headers. Missing headers yield empty fields.
ExtractNonceFn header_nonce_extractor(const std::string& nonce_header = "X-Nonce",
                                      const std::string& checksum_header = "X-Nonce-Checksum");

ExtractHashFn header_hash_extractor(const std::string& hash_header = "X-Hash");

struct JsonFieldNames {
    std::string nonce = "nonce";
    std::string nonce_checksum = "nonce_checksum";
    std::string hash = "hash";
};

// Builds the proof data string from the parsed request body.
using JsonDataFn = std::function<std::string(const json::object&)>;

/**
 * Combined extractor over a JSON request body.
 * A body that is not a JSON object, or a named field that is present but not a
 * string, aborts the request with 400 and throws ExtractionError.
 * Absent fields are returned empty.
 */
ExtractAllFn json_body_extractor(JsonDataFn data, JsonFieldNames names = {});

// Reads a string member, or "" when absent. Throws ExtractionError for other types.
std::string json_string_field(const json::object& obj, const std::string& key);

// Renders a JSON number without a fractional part ("42" for 42 or 42.0).
std::string json_number_as_decimal(const json::value& value);

}
