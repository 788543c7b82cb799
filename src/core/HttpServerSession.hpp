#ifndef HTTP_SERVER_SESSION_HPP
#define HTTP_SERVER_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <boost/config.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Forward declaration
class EmailService;

// One accepted connection. Reads a request, routes it to EmailService and
// writes the response back; keep-alive connections loop.
class HttpServerSession : public std::enable_shared_from_this<HttpServerSession> {
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<EmailService> email_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::function<void(std::shared_ptr<HttpServerSession>)> on_finish_callback_; // Called when session is done

    // The queue for outgoing responses.
    std::deque<std::shared_ptr<http::response<http::string_body>>> response_queue_;

    // Indicates if a write operation is currently in progress.
    bool write_in_progress_ = false;

    // Current request; kept alive until its response has been queued.
    http::request<http::string_body> req_;

public:
    HttpServerSession(
        tcp::socket&& socket,
        std::shared_ptr<EmailService> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config,
        std::function<void(std::shared_ptr<HttpServerSession>)> on_finish)
        : stream_(std::move(socket)),
          email_service_(service),
          logger_(logger),
          config_(config),
          on_finish_callback_(std::move(on_finish)) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for HttpServerSession");
        }
        logger_->debug("HttpServerSession " + id() + " created.");
    }

    ~HttpServerSession() {
        logger_->debug("HttpServerSession " + id() + " destroyed.");
    }

    void run() {
        // Start on the session's strand
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(
                          &HttpServerSession::do_read,
                          shared_from_this()));
    }

    // Called from the server on shutdown; pending operations complete with an error.
    void stop() {
        net::post(stream_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            if (self->stream_.socket().is_open()) {
                self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                if (ec && ec != beast::errc::not_connected) {
                    self->logger_->error("HttpServerSession " + self->id() + " socket shutdown error during stop: " + ec.message());
                }
                ec = {};
                self->stream_.socket().close(ec);
                if (ec) {
                    self->logger_->error("HttpServerSession " + self->id() + " socket close error during stop: " + ec.message());
                }
            }
        });
    }

private:
    std::string id() const {
        std::ostringstream oss;
        oss << static_cast<const void*>(this);
        return oss.str();
    }

    void do_read() {
        req_ = {}; // Clear previous request
        stream_.expires_after(std::chrono::seconds(30));

        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(
                             &HttpServerSession::on_read,
                             shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == http::error::end_of_stream) {
            return do_close();
        }

        if (ec) {
            if (ec == net::error::operation_aborted || ec == beast::error::timeout) {
                logger_->debug("HttpServerSession " + id() + " on_read: " + ec.message() + ". Closing.");
            } else {
                logger_->error("HttpServerSession " + id() + " on_read error: " + ec.message());
            }
            return do_close();
        }

        logger_->debug("HttpServerSession " + id() + " " + std::string(req_.method_string()) + " " + std::string(req_.target()));
        handle_request();
    }

    // Implemented in HttpServerSession.cpp
    void handle_request();

    // Queues a response on the session's strand.
    // If opt_res is std::nullopt, the request is dropped and no response is sent.
    void send_response(std::optional<http::response<http::string_body>>&& opt_res);

    void do_write() {
        if (response_queue_.empty()) {
            write_in_progress_ = false;
            return;
        }

        if (!stream_.socket().is_open()) {
            logger_->warn("HttpServerSession " + id() + " socket closed before write. Dropping " +
                          std::to_string(response_queue_.size()) + " queued response(s).");
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        write_in_progress_ = true;
        auto current_response_ptr = response_queue_.front();
        stream_.expires_after(std::chrono::seconds(30));

        http::async_write(stream_, *current_response_ptr,
            beast::bind_front_handler(
                &HttpServerSession::on_write,
                shared_from_this(),
                current_response_ptr->keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            if (ec == net::error::operation_aborted) {
                logger_->debug("HttpServerSession " + id() + " on_write: operation aborted. Closing.");
            } else {
                logger_->error("HttpServerSession " + id() + " on_write error: " + ec.message());
            }
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        if (!response_queue_.empty()) {
            response_queue_.pop_front();
        }

        if (!response_queue_.empty()) {
            return do_write();
        }

        write_in_progress_ = false;
        if (!keep_alive) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        if (stream_.socket().is_open()) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
        if (ec && ec != beast::errc::not_connected) {
            logger_->debug("HttpServerSession " + id() + " socket shutdown in do_close: " + ec.message());
        }

        // Notify the listener that this session is finished; the callback may
        // release the last reference to this session.
        if (on_finish_callback_) {
            auto cb = std::move(on_finish_callback_);
            on_finish_callback_ = nullptr;
            net::post(stream_.get_executor(), beast::bind_front_handler(std::move(cb), shared_from_this()));
        }
    }
};

#endif // HTTP_SERVER_SESSION_HPP
