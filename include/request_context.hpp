#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powgate {

// State of a single request as it moves through the pipeline steps.
// Owns the response under construction and a request-scoped key/value store.
// Never shared across requests.
class RequestContext {
public:
    explicit RequestContext(const http::request<http::string_body>& req,
                            std::string remote_addr = "unknown");

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const http::request<http::string_body>& request() const { return req_; }
    http::response<http::string_body>& response() { return res_; }
    const std::string& remote_addr() const { return remote_addr_; }

    // Request-scoped store, written by the nonce generation step.
    json::object& values() { return values_; }
    const json::object& values() const { return values_; }

    // Returns the request header value, or an empty string when absent.
    std::string header(const std::string& name) const;

    /**
     * Writes a plain response and stops the pipeline.
     * Only the first abort takes effect so a failure is never reported twice.
     */
    void abort_with_status(unsigned status, const std::string& body,
                           const std::string& content_type = "text/plain; charset=utf-8");
    void abort() { aborted_ = true; }
    bool is_aborted() const { return aborted_; }

    void add_error(const std::string& message) { errors_.push_back(message); }
    const std::vector<std::string>& errors() const { return errors_; }

    // Moves the finished response out, filling in Content-Length.
    http::response<http::string_body> release_response();

private:
    const http::request<http::string_body>& req_;
    http::response<http::string_body> res_;
    std::string remote_addr_;
    json::object values_;
    std::vector<std::string> errors_;
    bool aborted_ = false;
};

}
