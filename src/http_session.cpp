#include "http_session.hpp"
#include "http_headers.hpp"
#include "security_logger.hpp"
#include <boost/asio/dispatch.hpp>

namespace powgate {

HttpSession::HttpSession(
    tcp::socket&& socket,
    const ServerConfig& config,
    RequestRouter& router
)
    : stream_(std::move(socket))
    , config_(config)
    , router_(router)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

void HttpSession::run() {
    // Start on the session's strand
    net::dispatch(stream_.get_executor(),
        beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    // Enforce connection timeout to prevent slow-loris attacks
    stream_.expires_after(std::chrono::seconds(config_.connection_timeout_sec));

    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    http::async_read(stream_, buffer_, *parser_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == http::error::body_limit) {
        http::response<http::string_body> res{http::status::payload_too_large, 11};
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.body() = "request body too large";
        res.keep_alive(false);
        res.prepare_payload();
        add_security_headers(res);
        send_response(std::move(res));
        return;
    }
    if (ec) {
        return;
    }

    http::request<http::string_body> req = parser_->release();
    send_response(router_.route(req, remote_addr_));
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    bool close = sp->need_eof();

    auto self = shared_from_this();
    http::async_write(stream_, *sp,
        [self, sp, close](beast::error_code ec, std::size_t bytes) {
            self->on_write(close, ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SERVER,
                            remote_addr_, "write failed: " + ec.message());
        return;
    }
    if (close) {
        do_close();
        return;
    }
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
