#include "request_router.hpp"
#include "http_headers.hpp"
#include <boost/json.hpp>

namespace json = boost::json;

namespace powgate {

RequestRouter::RequestRouter(const ServerConfig& config)
    : health_handler_(config)
    , challenge_handler_(config)
{}

http::response<http::string_body> RequestRouter::route(const http::request<http::string_body>& req, const std::string& remote_addr) {
    std::string target(req.target());
    auto query = target.find('?');
    if (query != std::string::npos) target.erase(query);
    auto method = req.method();

    if (method == http::verb::options) {
        return handle_cors_preflight(req.version());
    }

    // --- Routing Table ---
    if (target == "/health" && method == http::verb::get) {
        return health_handler_.handle_health(req.version());
    }
    if (target == "/metrics" && method == http::verb::get) {
        bool is_local = (remote_addr == "127.0.0.1" || remote_addr == "::1");
        if (is_local) return health_handler_.handle_metrics(req.version());
        return handle_not_found(req.version());
    }

    // Proof-of-Work
    if (target == "/nonce/issue" && method == http::verb::get) {
        return challenge_handler_.handle_nonce_issue(req, remote_addr);
    }
    if (target == "/hash/verify" && method == http::verb::post) {
        return challenge_handler_.handle_hash_verify(req, remote_addr);
    }
    if (target == "/login" && method == http::verb::get) {
        return challenge_handler_.handle_login_difficulty(req);
    }
    if (target == "/login" && method == http::verb::post) {
        return challenge_handler_.handle_login(req, remote_addr);
    }

    return handle_not_found(req.version());
}

http::response<http::string_body> RequestRouter::handle_cors_preflight(unsigned version) {
    http::response<http::string_body> res{http::status::no_content, version};
    add_cors_headers(res);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> RequestRouter::handle_not_found(unsigned version) {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

}
