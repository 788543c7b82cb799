#include "EmailService.hpp"

#include <boost/beast/version.hpp>

#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

#include "IdempotencyGuard.hpp"
#include "RateLimiter.hpp"
#include "RetryPolicy.hpp"
#include "../providers/SimulatedEmailProvider.hpp"
#include "../utils/Utils.hpp"

namespace {
    const std::string MISSING_FIELDS_ERROR = "Missing required fields: to, subject, body, requestId";
    const std::string ALL_PROVIDERS_UNAVAILABLE =
        "All email providers are currently unavailable due to circuit breaker protection";
}

// --- Wiring ---

std::shared_ptr<FallbackOrchestrator> EmailService::buildOrchestrator(
    const AppConfig& config,
    std::shared_ptr<IClock> clock,
    std::shared_ptr<IResilienceObserver> observer,
    std::shared_ptr<ILogger> logger) {
    if (!logger) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }

    std::vector<std::shared_ptr<IEmailProvider>> providers;
    providers.reserve(config.providers.size());
    for (const auto& settings : config.providers) {
        providers.push_back(std::make_shared<SimulatedEmailProvider>(settings.name, settings.success_rate, logger));
        logger->setup("Registered provider " + settings.name + " (priority " + std::to_string(providers.size()) + ")");
    }

    CircuitBreakerConfig breaker_config;
    breaker_config.failure_threshold = static_cast<unsigned int>(config.circuit_breaker_failure_threshold);
    breaker_config.recovery_timeout = std::chrono::milliseconds(config.circuit_breaker_recovery_timeout_in_millis);
    breaker_config.monitoring_window = std::chrono::milliseconds(config.circuit_breaker_monitoring_window_in_millis);

    RetryPolicy retry_policy(static_cast<unsigned int>(config.retry_max_attempts),
                             std::chrono::milliseconds(config.retry_base_delay_in_millis),
                             std::chrono::milliseconds(config.retry_max_delay_in_millis));

    auto rate_limiter = std::make_shared<RateLimiter>(
        static_cast<size_t>(config.rate_limit_max_requests),
        std::chrono::milliseconds(config.rate_limit_window_in_millis),
        clock);

    return std::make_shared<FallbackOrchestrator>(
        std::move(providers),
        breaker_config,
        retry_policy,
        rate_limiter,
        std::make_shared<IdempotencyGuard>(),
        clock,
        observer,
        logger);
}

// --- Handlers ---

void EmailService::processSendEmailRequest(
    const http::request<http::string_body>& req,
    ResponseCallback send_response_cb) const {
    const unsigned int version = req.version();
    const bool keep_alive = req.keep_alive();
    try {
        std::optional<DeliveryRequest> request = parseDeliveryRequest(req.body());
        if (!request) {
            statsd_client_->increment(MetricsDefinitions::REQUEST_INVALID);
            send_response_cb(makeJsonResponse(http::status::bad_request, version, keep_alive,
                                              json{{"error", MISSING_FIELDS_ERROR}}));
            return;
        }

        if (!orchestrator_->isAnyProviderAvailable()) {
            logger_->warn("Rejecting request " + request->requestId + ": no provider available");
            auto best = orchestrator_->getBestAvailableProvider();
            json body = {
                {"error", "Service temporarily unavailable"},
                {"message", ALL_PROVIDERS_UNAVAILABLE},
                {"availableProvider", best ? json(*best) : json(nullptr)}
            };
            send_response_cb(makeJsonResponse(http::status::service_unavailable, version, keep_alive, body));
            return;
        }

        // Retry back-off blocks, so delivery runs on a worker thread
        auto orchestrator = orchestrator_;
        auto statsd_client = statsd_client_;
        auto logger = logger_;
        bool enqueued = worker_pool_->enqueue(
            [orchestrator, statsd_client, logger, delivery = std::move(*request), version, keep_alive, send_response_cb]() {
                try {
                    DeliveryOutcome outcome = orchestrator->execute(delivery);
                    auto status = outcome.success() ? http::status::ok : http::status::bad_request;
                    send_response_cb(makeJsonResponse(status, version, keep_alive, outcomeToJson(outcome)));
                } catch (const std::exception& e) {
                    logger->error("Unexpected exception while delivering " + delivery.requestId + ": " + e.what());
                    statsd_client->increment(MetricsDefinitions::CODE_EXCEPTION);
                    send_response_cb(makeJsonResponse(http::status::internal_server_error, version, keep_alive,
                                                      json{{"error", "Internal server error"}, {"message", e.what()}}));
                } catch (...) {
                    logger->error("Unknown exception while delivering " + delivery.requestId);
                    statsd_client->increment(MetricsDefinitions::CODE_EXCEPTION);
                    send_response_cb(makeJsonResponse(http::status::internal_server_error, version, keep_alive,
                                                      json{{"error", "Internal server error"}, {"message", "unknown error"}}));
                }
            });

        if (!enqueued) {
            send_response_cb(makeJsonResponse(http::status::service_unavailable, version, keep_alive,
                                              json{{"error", "Service temporarily unavailable"},
                                                   {"message", "Service is shutting down"}}));
        }
    } catch (const std::exception& e) {
        respondWithInternalError(version, keep_alive, e.what(), send_response_cb);
    }
}

void EmailService::processHealthRequest(
    const http::request<http::string_body>& req,
    ResponseCallback send_response_cb) const {
    try {
        const bool healthy = orchestrator_->isAnyProviderAvailable();
        json available = json::array();
        if (auto best = orchestrator_->getBestAvailableProvider()) {
            available.push_back(*best);
        }

        json body = {
            {"status", healthy ? "OK" : "DEGRADED"},
            {"service", serviceStatusToJson(orchestrator_->getServiceStatus())},
            {"rateLimit", rateLimitToJson(orchestrator_->getRateLimitStatus())},
            {"availableProviders", available}
        };
        send_response_cb(makeJsonResponse(healthy ? http::status::ok : http::status::service_unavailable,
                                          req.version(), req.keep_alive(), body));
    } catch (const std::exception& e) {
        respondWithInternalError(req.version(), req.keep_alive(), e.what(), send_response_cb);
    }
}

void EmailService::processCircuitBreakersRequest(
    const http::request<http::string_body>& req,
    ResponseCallback send_response_cb) const {
    try {
        json body = {
            {"status", "OK"},
            {"circuitBreakers", circuitBreakersJson()}
        };
        send_response_cb(makeJsonResponse(http::status::ok, req.version(), req.keep_alive(), body));
    } catch (const std::exception& e) {
        respondWithInternalError(req.version(), req.keep_alive(), e.what(), send_response_cb);
    }
}

void EmailService::processResetCircuitBreakersRequest(
    const http::request<http::string_body>& req,
    ResponseCallback send_response_cb) const {
    try {
        orchestrator_->resetCircuitBreakers();
        json body = {
            {"message", "All circuit breakers have been reset"},
            {"circuitBreakers", circuitBreakersJson()}
        };
        send_response_cb(makeJsonResponse(http::status::ok, req.version(), req.keep_alive(), body));
    } catch (const std::exception& e) {
        logger_->error("Failed to reset circuit breakers: " + std::string(e.what()));
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        send_response_cb(makeJsonResponse(http::status::internal_server_error, req.version(), req.keep_alive(),
                                          json{{"error", "Failed to reset circuit breakers"}, {"message", e.what()}}));
    }
}

void EmailService::processProvidersStatusRequest(
    const http::request<http::string_body>& req,
    ResponseCallback send_response_cb) const {
    try {
        auto best = orchestrator_->getBestAvailableProvider();
        json body = {
            {"anyProviderAvailable", orchestrator_->isAnyProviderAvailable()},
            {"bestAvailableProvider", best ? json(*best) : json(nullptr)},
            {"circuitBreakers", circuitBreakersJson()}
        };
        send_response_cb(makeJsonResponse(http::status::ok, req.version(), req.keep_alive(), body));
    } catch (const std::exception& e) {
        respondWithInternalError(req.version(), req.keep_alive(), e.what(), send_response_cb);
    }
}

void EmailService::shutdown() const {
    logger_->info("EmailService draining worker pool...");
    worker_pool_->shutdown();
}

// --- JSON projections ---

json EmailService::outcomeToJson(const DeliveryOutcome& outcome) {
    json j = {
        {"success", outcome.success()},
        {"attempts", outcome.attempts()},
        {"timestamp", outcome.timestampMs()},
        {"requestId", outcome.requestId()}
    };
    if (outcome.providerUsed()) {
        j["providerUsed"] = *outcome.providerUsed();
    }
    if (outcome.errorMessage()) {
        j["errorMessage"] = *outcome.errorMessage();
    }
    return j;
}

json EmailService::breakerStatusToJson(const CircuitBreakerStatus& status) {
    return json{
        {"providerName", status.provider_name},
        {"state", circuitStateToString(status.state)},
        {"failureCount", status.failure_count},
        {"nextAttemptTime", status.next_attempt_time ? json(Utils::formatIsoTime(*status.next_attempt_time))
                                                     : json(nullptr)},
        {"config", {
            {"failureThreshold", status.config.failure_threshold},
            {"recoveryTimeout", status.config.recovery_timeout.count()},
            {"monitoringWindow", status.config.monitoring_window.count()}
        }}
    };
}

json EmailService::rateLimitToJson(const RateLimitStatus& status) {
    return json{
        {"currentRequests", status.current_requests},
        {"maxRequests", status.max_requests},
        {"windowSize", status.window_size.count()}
    };
}

json EmailService::serviceStatusToJson(const ServiceStatus& status) {
    return json{
        {"providers", status.providers},
        {"maxRetries", status.max_attempts},
        {"baseDelay", status.base_delay.count()}
    };
}

// --- Private Helper Method Implementations ---

json EmailService::circuitBreakersJson() const {
    json breakers = json::object();
    for (const auto& status : orchestrator_->getCircuitBreakerStatus()) {
        breakers[status.provider_name] = breakerStatusToJson(status);
    }
    return breakers;
}

std::optional<DeliveryRequest> EmailService::parseDeliveryRequest(const std::string& body) const {
    json body_json;
    try {
        body_json = json::parse(body);
    } catch (const json::parse_error& e) {
        logger_->warn("Request body JSON parse error: " + std::string(e.what()));
        statsd_client_->increment(MetricsDefinitions::JSON_ERROR);
        return std::nullopt;
    }

    if (!body_json.is_object()) {
        return std::nullopt;
    }

    DeliveryRequest request;
    const std::pair<const char*, std::string*> fields[] = {
        {"to", &request.to},
        {"subject", &request.subject},
        {"body", &request.body},
        {"requestId", &request.requestId}
    };
    for (const auto& field : fields) {
        auto it = body_json.find(field.first);
        if (it == body_json.end() || !it->is_string()) {
            return std::nullopt;
        }
        *field.second = it->get<std::string>();
    }

    if (!request.isComplete()) {
        return std::nullopt;
    }
    return request;
}

void EmailService::respondWithInternalError(
    unsigned int version,
    bool keep_alive,
    const std::string& message,
    const ResponseCallback& send_response_cb) const {
    logger_->error("Unexpected exception in EmailService handler: " + message);
    statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
    send_response_cb(makeJsonResponse(http::status::internal_server_error, version, keep_alive,
                                      json{{"error", "Internal server error"}, {"message", message}}));
}

http::response<http::string_body> EmailService::makeJsonResponse(
    http::status status,
    unsigned int version,
    bool keep_alive,
    const json& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}
