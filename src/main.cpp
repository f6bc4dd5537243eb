#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <cstdlib>

#include "server_config.hpp"
#include "http_session.hpp"
#include "request_router.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powgate {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        RequestRouter& router
    )
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , router_(router)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    RequestRouter& router_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::SERVER, "internal", "Accept error: " + ec.message());
        } else {
            MetricsRegistry::instance().increment_counter("http_connections_accepted");
            std::make_shared<HttpSession>(std::move(socket), config_, router_)->run();
        }

        do_accept();
    }
};

}

int main(int argc, char* argv[]) {
    using powgate::SecurityLogger;
    try {
        powgate::ServerConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port]\n"
                          << "Environment:\n"
                          << "  POWGATE_ADDR, POWGATE_PORT, POWGATE_THREADS, POWGATE_MAX_BODY\n"
                          << "  POWGATE_SECRET                 checksum key (random when unset)\n"
                          << "  POWGATE_VERIFY_DIFFICULTY      leading zero bits for /hash/verify\n"
                          << "  POWGATE_LOGIN_DIFFICULTY       leading zero bits for /login\n"
                          << "  POWGATE_NONCE_LENGTH, POWGATE_FAILURE_STATUS\n";
                return 0;
            }
            int port = 0;
            try {
                port = std::stoi(arg);
            } catch (const std::exception&) {
                port = 0;
            }
            if (port < 1 || port > 65535) {
                std::cerr << "[!] Invalid port: " << arg << "\n";
                return 1;
            }
            config.port = static_cast<uint16_t>(port);
        }

        // --- Environment Variable Overrides ---
        powgate::apply_env_overrides(config);

        if (config.secret.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONFIGURATION, "internal",
                                "POWGATE_SECRET not set, issued nonces become unverifiable after restart");
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        net::io_context ioc{config.thread_count};

        powgate::RequestRouter router(config);

        auto listener = std::make_shared<powgate::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            router
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SERVER, "internal",
                            "listening on " + config.address + ":" + std::to_string(config.port) +
                            " verify_difficulty=" + std::to_string(config.verify_difficulty) +
                            " login_difficulty=" + std::to_string(config.login_difficulty));

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SERVER, "internal", "Initiating graceful shutdown");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
