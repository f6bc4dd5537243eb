#include "pow_middleware.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace powgate {

namespace {

std::string trim_lower(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Quality value of one Accept entry's parameters, 1.0 when absent or unparsable.
double quality_of(const std::string& params) {
    std::stringstream ss(params);
    std::string param;
    while (std::getline(ss, param, ';')) {
        param = trim_lower(param);
        if (param.rfind("q=", 0) == 0) {
            try {
                return std::stod(param.substr(2));
            } catch (const std::exception&) {
                return 1.0;
            }
        }
    }
    return 1.0;
}

std::string xml_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

// Same shape as a flat JSON object: <map><key>value</key>...</map>
std::string to_xml(const json::object& obj) {
    std::stringstream ss;
    ss << "<map>";
    for (const auto& kv : obj) {
        std::string key(kv.key());
        ss << "<" << key << ">";
        if (kv.value().is_string()) {
            ss << xml_escape(std::string(kv.value().as_string()));
        } else {
            ss << json::serialize(kv.value());
        }
        ss << "</" << key << ">";
    }
    ss << "</map>";
    return ss.str();
}

}

BodyFormat negotiate_body_format(const std::string& accept) {
    if (trim_lower(accept).empty()) return BodyFormat::Json;

    BodyFormat best = BodyFormat::Unacceptable;
    double best_q = 0.0;

    std::stringstream ss(accept);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        auto semi = entry.find(';');
        std::string range = trim_lower(entry.substr(0, semi));
        double q = semi == std::string::npos ? 1.0 : quality_of(entry.substr(semi + 1));
        if (q <= 0.0) continue;

        BodyFormat candidate = BodyFormat::Unacceptable;
        if (range == "application/json" || range == "application/*" || range == "*/*") {
            candidate = BodyFormat::Json;
        } else if (range == "application/xml" || range == "text/xml") {
            candidate = BodyFormat::Xml;
        }

        if (candidate != BodyFormat::Unacceptable && q > best_q) {
            best = candidate;
            best_q = q;
        }
    }
    return best;
}

PowMiddleware::PowMiddleware(PowOptions options)
    : settings_(resolve_options(std::move(options)))
    , issuer_(settings_.nonce_length, settings_.check, settings_.secret, settings_.digest, settings_.nonce_generator)
    , engine_(settings_.policy(), settings_.extractor)
{}

bool PowMiddleware::current_nonce(RequestContext& ctx, CurrentNonce& out) const {
    const auto& values = ctx.values();
    auto stashed = values.find(settings_.nonce_context_key);
    if (stashed != values.end() && stashed->value().is_string()) {
        out.nonce = std::string(stashed->value().as_string());
        out.checksum_hex.clear();
        if (settings_.check) {
            auto cs = values.find(settings_.nonce_checksum_context_key);
            if (cs != values.end() && cs->value().is_string()) {
                out.checksum_hex = std::string(cs->value().as_string());
            }
        }
        return true;
    }

    try {
        IssuedNonce issued = issuer_.generate();
        out.nonce = std::move(issued.nonce);
        out.checksum_hex = InputValidator::hex_encode(issued.checksum);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::ISSUANCE_FAILURE,
                            ctx.remote_addr(), e.what());
        MetricsRegistry::instance().increment_counter("pow_issuance_failures");
        ctx.add_error(e.what());
        ctx.abort_with_status(500, "failed to generate nonce");
        return false;
    }

    MetricsRegistry::instance().increment_counter("pow_nonces_issued");
    return true;
}

void PowMiddleware::handle_nonce_request(RequestContext& ctx) const {
    BodyFormat format = negotiate_body_format(ctx.header("Accept"));
    if (format == BodyFormat::Unacceptable) {
        ctx.abort_with_status(406, "supported formats: application/json, application/xml");
        return;
    }

    CurrentNonce current;
    if (!current_nonce(ctx, current)) return;

    json::object body;
    body[settings_.nonce_data_key] = current.nonce;
    body[settings_.hash_difficulty_data_key] = settings_.difficulty;
    if (settings_.check) {
        body[settings_.nonce_checksum_data_key] = current.checksum_hex;
    }

    auto& res = ctx.response();
    res.result(http::status::ok);
    if (format == BodyFormat::Xml) {
        res.set(http::field::content_type, "application/xml; charset=utf-8");
        res.body() = to_xml(body);
    } else {
        res.set(http::field::content_type, "application/json");
        res.body() = json::serialize(body);
    }
}

void PowMiddleware::set_nonce_headers(RequestContext& ctx) const {
    CurrentNonce current;
    if (!current_nonce(ctx, current)) return;

    auto& res = ctx.response();
    res.set(settings_.nonce_header, current.nonce);
    res.set(settings_.hash_difficulty_header, std::to_string(settings_.difficulty));
    if (settings_.check) {
        res.set(settings_.nonce_checksum_header, current.checksum_hex);
    }
}

void PowMiddleware::generate_nonce(RequestContext& ctx) const {
    IssuedNonce issued;
    try {
        issued = issuer_.generate();
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::ISSUANCE_FAILURE,
                            ctx.remote_addr(), e.what());
        MetricsRegistry::instance().increment_counter("pow_issuance_failures");
        ctx.add_error(e.what());
        ctx.abort_with_status(500, "failed to generate nonce");
        return;
    }
    MetricsRegistry::instance().increment_counter("pow_nonces_issued");

    auto& values = ctx.values();
    values[settings_.nonce_context_key] = issued.nonce;
    values[settings_.hash_difficulty_context_key] = settings_.difficulty;
    if (settings_.check) {
        values[settings_.nonce_checksum_context_key] = InputValidator::hex_encode(issued.checksum);
    }
}

bool PowMiddleware::verify_request(RequestContext& ctx) const {
    VerificationResult result = engine_.verify(ctx);
    auto& metrics = MetricsRegistry::instance();

    switch (result.outcome) {
        case Outcome::Accepted:
            metrics.increment_counter("pow_verify_accepted");
            return true;

        case Outcome::ExtractionFailed:
            metrics.increment_counter("pow_verify_extraction_failed");
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::EXTRACTION_FAILURE,
                                ctx.remote_addr(), result.message);
            ctx.add_error(result.message);
            ctx.abort_with_status(500, "failed to extract proof of work fields");
            return false;

        case Outcome::MalformedRequest:
            metrics.increment_counter("pow_verify_malformed");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::MALFORMED_REQUEST,
                                ctx.remote_addr(), result.message);
            ctx.add_error(result.message);
            ctx.abort_with_status(400, result.message);
            return false;

        case Outcome::ChecksumInvalid:
        case Outcome::DifficultyNotMet:
            break;
    }

    const VerificationError& err = *result.error;
    if (result.outcome == Outcome::ChecksumInvalid) {
        metrics.increment_counter("pow_verify_checksum_invalid");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CHECKSUM_INVALID,
                            ctx.remote_addr(), err.describe());
    } else {
        metrics.increment_counter("pow_verify_difficulty_not_met");
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::DIFFICULTY_NOT_MET,
                            ctx.remote_addr(), err.describe());
    }

    ctx.add_error(err.reason);
    settings_.on_failed_verification(ctx, err);
    // A custom handler owns the response; the pipeline stops either way.
    ctx.abort();
    return false;
}

}
