#pragma once

#include <boost/beast/http.hpp>
#include <string>

#include "server_config.hpp"
#include "handlers/challenge_handler.hpp"
#include "handlers/health_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace powgate {

// Routing table of the demo server, independent of the socket layer.
class RequestRouter {
public:
    explicit RequestRouter(const ServerConfig& config);

    http::response<http::string_body> route(const http::request<http::string_body>& req, const std::string& remote_addr);

private:
    HealthHandler health_handler_;
    ChallengeHandler challenge_handler_;

    http::response<http::string_body> handle_cors_preflight(unsigned version);
    http::response<http::string_body> handle_not_found(unsigned version);
};

}
