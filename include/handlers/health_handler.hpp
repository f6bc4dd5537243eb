#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powgate {

class HealthHandler {
public:
    explicit HealthHandler(const ServerConfig& config)
        : config_(config) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

private:
    const ServerConfig& config_;
};

} // namespace powgate
