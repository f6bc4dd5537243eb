#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "server_config.hpp"
#include "request_router.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powgate {

// One keep-alive HTTP connection. Requests are read, routed and answered in sequence.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        tcp::socket&& socket,
        const ServerConfig& config,
        RequestRouter& router
    );

    ~HttpSession() = default;

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    RequestRouter& router_;

    std::string remote_addr_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

}
