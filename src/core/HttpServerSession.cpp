#include "HttpServerSession.hpp"
#include "EmailService.hpp"

#include <iterator>
#include <string_view>

namespace {
    using RouteHandler = void (EmailService::*)(const http::request<http::string_body>&,
                                                EmailService::ResponseCallback) const;

    struct Route {
        http::verb method;
        std::string_view path;
        RouteHandler handler;
    };

    const Route ROUTES[] = {
        {http::verb::post, "/send-email", &EmailService::processSendEmailRequest},
        {http::verb::get, "/health", &EmailService::processHealthRequest},
        {http::verb::get, "/circuit-breakers", &EmailService::processCircuitBreakersRequest},
        {http::verb::post, "/admin/reset-circuit-breakers", &EmailService::processResetCircuitBreakersRequest},
        {http::verb::get, "/providers/status", &EmailService::processProvidersStatusRequest},
    };

    const Route* findRoute(http::verb method, std::string_view path) {
        for (const auto& route : ROUTES) {
            if (route.method == method && route.path == path) {
                return &route;
            }
        }
        return nullptr;
    }
}

// Called from on_read once req_ holds a complete request.
void HttpServerSession::handle_request() {
    if (!email_service_) {
        logger_->error("HttpServerSession " + id() + ": EmailService is null.");
        http::response<http::string_body> res{http::status::internal_server_error, req_.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req_.keep_alive());
        res.body() = "Internal server error: service not available.";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    std::string_view target_path(req_.target().data(), req_.target().size());
    size_t query_pos = target_path.find('?');
    if (query_pos != std::string_view::npos) {
        target_path = target_path.substr(0, query_pos);
    }

    const Route* route = findRoute(req_.method(), target_path);
    if (!route) {
        logger_->debug("HttpServerSession " + id() + " no route for " + std::string(req_.method_string()) +
                       " " + std::string(req_.target()));
        http::response<http::string_body> res{http::status::not_found, req_.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req_.keep_alive());
        res.body() = "The resource '" + std::string(req_.target()) + "' was not found.";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    // EmailService may answer from a worker thread; hop back onto this session's strand.
    ((*email_service_).*(route->handler))(req_,
        [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
            net::post(self->stream_.get_executor(),
                [self, res = std::move(opt_res)]() mutable {
                    self->send_response(std::move(res));
                });
        });
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + ": no response for '" + std::string(req_.target()) + "'. Dropping request.");
        if (write_in_progress_) {
            return;
        }
        if (req_.keep_alive()) {
            return do_read();
        }
        return do_close();
    }

    if (response_queue_.size() >= config_.max_response_queue_size) {
        // The front response is being written while a write is in progress; discard the oldest pending one.
        auto oldest_pending = write_in_progress_ ? std::next(response_queue_.begin()) : response_queue_.begin();
        if (oldest_pending != response_queue_.end()) {
            if (logger_->getLogLevel() <= LogUtils::LogLevel::WARN) {
                logger_->warn("HttpServerSession " + id() + ": response queue is full (max " +
                    std::to_string(config_.max_response_queue_size) + "). Discarding oldest response (status " +
                    std::to_string((*oldest_pending)->result_int()) + ").");
            }
            response_queue_.erase(oldest_pending);
        }
    }

    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));

    if (!write_in_progress_) {
        do_write();
    }
}
