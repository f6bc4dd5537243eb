#include "handlers/challenge_handler.hpp"
#include "extractors.hpp"
#include "http_headers.hpp"
#include "metrics.hpp"
#include "request_context.hpp"

namespace powgate {

namespace {

http::response<http::string_body> finish(RequestContext& ctx) {
    auto res = ctx.release_response();
    add_security_headers(res);
    add_cors_headers(res);
    return res;
}

http::response<http::string_body> plain_ok(RequestContext& ctx, const std::string& text) {
    auto& res = ctx.response();
    res.result(http::status::ok);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = text;
    return finish(ctx);
}

}

ChallengeHandler::ChallengeHandler(const ServerConfig& config)
    : verify_pow_(verify_options(config))
    , login_pow_(login_options(config))
{
    auto& metrics = MetricsRegistry::instance();
    metrics.set_gauge("pow_verify_difficulty_bits", verify_pow_.difficulty());
    metrics.set_gauge("pow_login_difficulty_bits", login_pow_.difficulty());
}

PowOptions ChallengeHandler::verify_options(const ServerConfig& config) {
    PowOptions opts;
    opts.check = true;
    opts.secret = config.secret;
    opts.difficulty = config.verify_difficulty;
    opts.nonce_length = config.nonce_length;
    opts.failure_status_code = config.failure_status_code;
    opts.verify_digest = true;
    opts.extract_all = json_body_extractor([](const json::object& body) {
        auto it = body.find("counter");
        if (it == body.end()) {
            throw ExtractionError("field 'counter' is required");
        }
        return json_number_as_decimal(it->value());
    });
    return opts;
}

PowOptions ChallengeHandler::login_options(const ServerConfig& config) {
    PowOptions opts;
    opts.difficulty = config.login_difficulty;
    opts.nonce_length = config.nonce_length;
    opts.failure_status_code = config.failure_status_code;
    opts.verify_digest = true;
    opts.extract_all = json_body_extractor([](const json::object& body) {
        return json_string_field(body, "username") + json_string_field(body, "password");
    });
    return opts;
}

http::response<http::string_body> ChallengeHandler::handle_nonce_issue(const http::request<http::string_body>& req, const std::string& remote_addr) {
    RequestContext ctx(req, remote_addr);

    verify_pow_.generate_nonce(ctx);
    if (!ctx.is_aborted()) verify_pow_.set_nonce_headers(ctx);
    if (!ctx.is_aborted()) verify_pow_.handle_nonce_request(ctx);

    return finish(ctx);
}

http::response<http::string_body> ChallengeHandler::handle_hash_verify(const http::request<http::string_body>& req, const std::string& remote_addr) {
    RequestContext ctx(req, remote_addr);
    if (!verify_pow_.verify_request(ctx)) {
        return finish(ctx);
    }
    return plain_ok(ctx, "proof of work accepted");
}

http::response<http::string_body> ChallengeHandler::handle_login_difficulty(const http::request<http::string_body>& req) {
    RequestContext ctx(req);
    return plain_ok(ctx, std::to_string(login_pow_.difficulty()));
}

http::response<http::string_body> ChallengeHandler::handle_login(const http::request<http::string_body>& req, const std::string& remote_addr) {
    RequestContext ctx(req, remote_addr);
    if (!login_pow_.verify_request(ctx)) {
        return finish(ctx);
    }
    return plain_ok(ctx, "logged in");
}

} // namespace powgate
