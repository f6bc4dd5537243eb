#include "extractors.hpp"
#include "input_validator.hpp"

#include <iomanip>
#include <sstream>

namespace powgate {

CombinedExtractor::CombinedExtractor(ExtractAllFn extract_all)
    : extract_all_(std::move(extract_all))
{}

Extraction CombinedExtractor::extract(RequestContext& ctx) const {
    return extract_all_(ctx);
}

SplitExtractor::SplitExtractor(ExtractNonceFn extract_nonce, ExtractDataFn extract_data, ExtractHashFn extract_hash)
    : extract_nonce_(std::move(extract_nonce))
    , extract_data_(std::move(extract_data))
    , extract_hash_(std::move(extract_hash))
{}

Extraction SplitExtractor::extract(RequestContext& ctx) const {
    Extraction fields;
    NonceFields nonce = extract_nonce_(ctx);
    fields.nonce = std::move(nonce.nonce);
    fields.nonce_checksum = std::move(nonce.nonce_checksum);
    fields.data = extract_data_(ctx);
    fields.hash = extract_hash_(ctx);
    return fields;
}

ExtractNonceFn header_nonce_extractor(const std::string& nonce_header, const std::string& checksum_header) {
    return [nonce_header, checksum_header](RequestContext& ctx) {
        return NonceFields{ctx.header(nonce_header), ctx.header(checksum_header)};
    };
}

ExtractHashFn header_hash_extractor(const std::string& hash_header) {
    return [hash_header](RequestContext& ctx) {
        return ctx.header(hash_header);
    };
}

std::string json_string_field(const json::object& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return "";
    if (!it->value().is_string()) {
        throw ExtractionError("field '" + key + "' must be a string");
    }
    return std::string(it->value().as_string());
}

std::string json_number_as_decimal(const json::value& value) {
    if (value.is_int64()) return std::to_string(value.as_int64());
    if (value.is_uint64()) return std::to_string(value.as_uint64());
    if (value.is_double()) {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(0) << value.as_double();
        return ss.str();
    }
    throw ExtractionError("expected a JSON number");
}

ExtractAllFn json_body_extractor(JsonDataFn data, JsonFieldNames names) {
    return [data = std::move(data), names = std::move(names)](RequestContext& ctx) {
        json::value body;
        try {
            body = InputValidator::safe_parse_json(ctx.request().body());
        } catch (const std::exception& e) {
            ctx.abort_with_status(400, "request body is not valid JSON");
            throw ExtractionError(std::string("invalid JSON body: ") + e.what());
        }

        if (!body.is_object()) {
            ctx.abort_with_status(400, "request body must be a JSON object");
            throw ExtractionError("JSON body is not an object");
        }

        const auto& obj = body.as_object();
        try {
            Extraction fields;
            fields.nonce = json_string_field(obj, names.nonce);
            fields.nonce_checksum = json_string_field(obj, names.nonce_checksum);
            fields.hash = json_string_field(obj, names.hash);
            fields.data = data(obj);
            return fields;
        } catch (const ExtractionError& e) {
            ctx.abort_with_status(400, e.what());
            throw;
        }
    };
}

}
