#include "request_context.hpp"

namespace powgate {

RequestContext::RequestContext(const http::request<http::string_body>& req, std::string remote_addr)
    : req_(req)
    , res_{http::status::ok, req.version()}
    , remote_addr_(std::move(remote_addr))
{
    res_.keep_alive(req.keep_alive());
}

std::string RequestContext::header(const std::string& name) const {
    auto it = req_.find(name);
    if (it == req_.end()) return "";
    return std::string(it->value());
}

void RequestContext::abort_with_status(unsigned status, const std::string& body, const std::string& content_type) {
    if (aborted_) return;
    aborted_ = true;

    res_.result(status);
    res_.set(http::field::content_type, content_type);
    res_.body() = body;
}

http::response<http::string_body> RequestContext::release_response() {
    res_.prepare_payload();
    return std::move(res_);
}

}
