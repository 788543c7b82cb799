#include "BeastHttpServer.hpp"
#include "EmailService.hpp"

#include <boost/asio/strand.hpp>

#include <sstream>
#include <vector>

void BeastHttpServer::stop() {
    logger_->info("BeastHttpServer stopping...");
    beast::error_code ec;
    acceptor_.cancel(ec); // Cancel pending async_accept
    if (ec) logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
    acceptor_.close(ec);
    if (ec) logger_->error("BeastHttpServer acceptor close error: " + ec.message());
    logger_->info("BeastHttpServer stopped accepting new connections.");

    // Sessions remove themselves through on_session_finish, so stop a snapshot
    std::vector<std::shared_ptr<HttpServerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.assign(active_sessions_.begin(), active_sessions_.end());
        active_sessions_.clear();
    }
    for (const auto& session_ptr : sessions) {
        session_ptr->stop();
    }
}

void BeastHttpServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_), // Each session gets its own strand
        beast::bind_front_handler(
            &BeastHttpServer::on_accept,
            shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return; // Acceptor closed by stop()
        }
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept(); // Don't stop accepting on recoverable errors
    }

    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        email_service_,
        logger_,
        config_,
        [self = shared_from_this()](std::shared_ptr<HttpServerSession> session_to_remove) {
            self->on_session_finish(session_to_remove);
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }

    session->run();
    do_accept(); // Accept another connection
}

void BeastHttpServer::on_session_finish(std::shared_ptr<HttpServerSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    active_sessions_.erase(session);
    if (logger_->isDebugEnabled()) {
        std::ostringstream oss;
        oss << static_cast<void*>(session.get());
        logger_->debug("BeastHttpServer removed session " + oss.str() + ". Active sessions: " +
                       std::to_string(active_sessions_.size()));
    }
}
