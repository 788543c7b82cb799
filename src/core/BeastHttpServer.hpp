#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "../interfaces/ILogger.hpp"
#include "../config/AppConfig.hpp"
#include "HttpServerSession.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Forward declaration
class EmailService;

// Accepts connections and tracks one HttpServerSession per connection.
class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<EmailService> email_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;

public:
    BeastHttpServer(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<EmailService> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config)
        : ioc_(ioc),
          acceptor_(ioc),
          email_service_(service),
          logger_(logger),
          config_(config) {
        if (!email_service_) {
            throw std::invalid_argument("EmailService cannot be null for BeastHttpServer");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for BeastHttpServer");
        }

        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        failOnError(ec, "open acceptor");

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        failOnError(ec, "set_option");

        acceptor_.bind(endpoint, ec);
        failOnError(ec, "bind to port " + std::to_string(endpoint.port()));

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        failOnError(ec, "listen");
    }

    void run() {
        do_accept();
    }

    // Port actually bound; differs from the requested one when binding to port 0.
    unsigned short port() const {
        return acceptor_.local_endpoint().port();
    }

    void stop();

private:
    void failOnError(const beast::error_code& ec, const std::string& what) {
        if (ec) {
            logger_->error("BeastHttpServer " + what + " error: " + ec.message());
            throw std::runtime_error("BeastHttpServer failed to " + what + ": " + ec.message());
        }
    }

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(std::shared_ptr<HttpServerSession> session);
};

#endif // BEAST_HTTP_SERVER_HPP
