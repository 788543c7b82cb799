#ifndef EMAILSERVICE_HPP
#define EMAILSERVICE_HPP

#include <boost/beast/http.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "FallbackOrchestrator.hpp"
#include "ThreadPoolQueue.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IResilienceObserver.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

using json = nlohmann::json;

// HTTP-facing facade over the FallbackOrchestrator. Handlers are invoked by
// HttpServerSession and always complete through send_response_cb, possibly
// from a worker thread.
class EmailService {
public:
    using ResponseCallback = std::function<void(std::optional<http::response<http::string_body>>)>;

    EmailService(std::shared_ptr<FallbackOrchestrator> orchestrator,
                 std::shared_ptr<ThreadPoolQueue> worker_pool,
                 std::shared_ptr<IStatsDClient> statsd_client,
                 std::shared_ptr<ILogger> logger)
        : orchestrator_(orchestrator),
        worker_pool_(worker_pool),
        statsd_client_(statsd_client),
        logger_(logger) {
        if (!orchestrator_) {
            throw std::invalid_argument("FallbackOrchestrator pointer cannot be null");
        }
        if (!worker_pool_) {
            throw std::invalid_argument("ThreadPoolQueue pointer cannot be null");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient pointer cannot be null");
        }
        if (!logger_) {
            throw std::invalid_argument("Logger pointer cannot be null");
        }
        logger_->debug("EmailService initialized");
    }

    virtual ~EmailService() = default;

    EmailService(const EmailService&) = delete;
    EmailService& operator=(const EmailService&) = delete;
    EmailService(EmailService&&) = delete;
    EmailService& operator=(EmailService&&) = delete;

    // Wires providers, breakers, retry policy, rate limiter and idempotency guard from configuration.
    static std::shared_ptr<FallbackOrchestrator> buildOrchestrator(
        const AppConfig& config,
        std::shared_ptr<IClock> clock,
        std::shared_ptr<IResilienceObserver> observer,
        std::shared_ptr<ILogger> logger);

    // --- Called by HttpServerSession ---
    void processSendEmailRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;
    void processHealthRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;
    void processCircuitBreakersRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;
    void processResetCircuitBreakersRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;
    void processProvidersStatusRequest(const http::request<http::string_body>& req, ResponseCallback send_response_cb) const;

    // Stop taking new deliveries; queued deliveries still complete.
    void shutdown() const;

    // --- JSON projections ---
    static json outcomeToJson(const DeliveryOutcome& outcome);
    static json breakerStatusToJson(const CircuitBreakerStatus& status);
    static json rateLimitToJson(const RateLimitStatus& status);
    static json serviceStatusToJson(const ServiceStatus& status);

private:
    std::shared_ptr<FallbackOrchestrator> orchestrator_;
    std::shared_ptr<ThreadPoolQueue> worker_pool_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;

    json circuitBreakersJson() const;
    std::optional<DeliveryRequest> parseDeliveryRequest(const std::string& body) const;
    void respondWithInternalError(unsigned int version,
                                  bool keep_alive,
                                  const std::string& message,
                                  const ResponseCallback& send_response_cb) const;

    static http::response<http::string_body> makeJsonResponse(
        http::status status,
        unsigned int version,
        bool keep_alive,
        const json& body);
};

#endif // EMAILSERVICE_HPP
