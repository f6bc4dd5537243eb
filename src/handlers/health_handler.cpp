#include "handlers/health_handler.hpp"
#include "http_headers.hpp"

namespace powgate {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["storage"] = "none";
    response["message"] = "Stateless proof-of-work gate - no nonces stored";
    response["verify_difficulty"] = config_.verify_difficulty;
    response["login_difficulty"] = config_.login_difficulty;

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    add_cors_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

} // namespace powgate
