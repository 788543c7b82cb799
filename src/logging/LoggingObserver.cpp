#include "LoggingObserver.hpp"

#include <sstream>

#include "../config/AppConfig.hpp"

void LoggingObserver::onCircuitStateChange(const std::string& provider, CircuitState from, CircuitState to) {
    std::string message = "[CircuitBreaker] " + provider + ": " +
        circuitStateToString(from) + " -> " + circuitStateToString(to);

    switch (to) {
        case CircuitState::OPEN:
            logger_->warn(message);
            statsd_client_->incrementFor(MetricsDefinitions::CIRCUIT_BREAKER_OPENED, provider);
            break;
        case CircuitState::HALF_OPEN:
            logger_->info(message + " - allowing test request");
            statsd_client_->incrementFor(MetricsDefinitions::CIRCUIT_BREAKER_HALF_OPENED, provider);
            break;
        case CircuitState::CLOSED:
            logger_->info(message);
            statsd_client_->incrementFor(MetricsDefinitions::CIRCUIT_BREAKER_CLOSED, provider);
            break;
    }
}

void LoggingObserver::onFailureRecorded(const std::string& provider, unsigned int failure_count, unsigned int threshold) {
    logger_->debug("[CircuitBreaker] " + provider + ": Failure " +
                   std::to_string(failure_count) + "/" + std::to_string(threshold));
}

void LoggingObserver::onAttempt(const std::string& provider, const std::string& request_id, unsigned int attempt) {
    if (logger_->isDebugEnabled()) {
        logger_->debug("[FallbackOrchestrator] Attempt " + std::to_string(attempt) + " with " + provider +
                       " for request " + request_id);
    }
    statsd_client_->incrementFor(MetricsDefinitions::PROVIDER_ATTEMPT, provider);
}

void LoggingObserver::onAttemptFailed(const std::string& provider, const std::string& request_id,
                                      unsigned int attempt, const std::string& error) {
    logger_->warn("[FallbackOrchestrator] " + provider + " attempt " + std::to_string(attempt) +
                  " failed for request " + request_id + ": " + error);
    statsd_client_->incrementFor(MetricsDefinitions::PROVIDER_ATTEMPT_FAILED, provider);
}

void LoggingObserver::onRetryScheduled(const std::string& provider, const std::string& request_id,
                                       std::chrono::milliseconds delay) {
    logger_->debug("[FallbackOrchestrator] Waiting " + std::to_string(delay.count()) + "ms before retrying " +
                   provider + " for request " + request_id);
    statsd_client_->incrementFor(MetricsDefinitions::PROVIDER_RETRY_SCHEDULED, provider);
}

void LoggingObserver::onProviderDenied(const std::string& provider, const std::string& request_id) {
    logger_->warn("[CircuitBreaker] " + provider + ": Circuit OPEN - blocking request " + request_id);
    statsd_client_->incrementFor(MetricsDefinitions::PROVIDER_DENIED, provider);
}

void LoggingObserver::onRequestRejected(const std::string& request_id, const std::string& reason) {
    logger_->info("[FallbackOrchestrator] Rejected request " + request_id + ": " + reason);
    if (reason == DeliveryMessages::DUPLICATE_REQUEST) {
        statsd_client_->increment(MetricsDefinitions::REQUEST_DUPLICATE);
    } else if (reason == DeliveryMessages::RATE_LIMITED) {
        statsd_client_->increment(MetricsDefinitions::REQUEST_RATE_LIMITED);
    } else {
        statsd_client_->increment(MetricsDefinitions::REQUEST_INVALID);
    }
}

void LoggingObserver::onDeliveryCompleted(const DeliveryOutcome& outcome, std::chrono::milliseconds elapsed) {
    if (outcome.success()) {
        logger_->info("[FallbackOrchestrator] " + outcome.to_string());
        statsd_client_->increment(MetricsDefinitions::DELIVERY_SUCCESS);
    } else {
        logger_->error("[FallbackOrchestrator] All providers failed: " + outcome.to_string());
        statsd_client_->increment(MetricsDefinitions::DELIVERY_FAILED);
    }
    statsd_client_->timing(MetricsDefinitions::DELIVERY_LATENCY, elapsed);
}
