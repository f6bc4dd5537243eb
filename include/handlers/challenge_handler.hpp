#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "server_config.hpp"
#include "pow_middleware.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace powgate {

// Demo endpoints guarded by two proof-of-work middleware instances:
// a checksummed counter puzzle and a login form.
class ChallengeHandler {
public:
    explicit ChallengeHandler(const ServerConfig& config);

    // GET /nonce/issue: issues a nonce for /hash/verify in both body and headers.
    http::response<http::string_body> handle_nonce_issue(const http::request<http::string_body>& req, const std::string& remote_addr);

    // POST /hash/verify: {"nonce", "nonce_checksum", "counter", "hash"}
    http::response<http::string_body> handle_hash_verify(const http::request<http::string_body>& req, const std::string& remote_addr);

    // GET /login: the login difficulty as plain text.
    http::response<http::string_body> handle_login_difficulty(const http::request<http::string_body>& req);

    // POST /login: {"nonce", "username", "password", "hash"}
    http::response<http::string_body> handle_login(const http::request<http::string_body>& req, const std::string& remote_addr);

    const PowMiddleware& verify_pow() const { return verify_pow_; }
    const PowMiddleware& login_pow() const { return login_pow_; }

private:
    PowMiddleware verify_pow_;
    PowMiddleware login_pow_;

    static PowOptions verify_options(const ServerConfig& config);
    static PowOptions login_options(const ServerConfig& config);
};

} // namespace powgate
