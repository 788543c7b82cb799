#include "FallbackOrchestrator.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

FallbackOrchestrator::FallbackOrchestrator(std::vector<std::shared_ptr<IEmailProvider>> providers,
                                           CircuitBreakerConfig breaker_config,
                                           RetryPolicy retry_policy,
                                           std::shared_ptr<RateLimiter> rate_limiter,
                                           std::shared_ptr<IdempotencyGuard> idempotency_guard,
                                           std::shared_ptr<IClock> clock,
                                           std::shared_ptr<IResilienceObserver> observer,
                                           std::shared_ptr<ILogger> logger)
    : retry_policy_(std::move(retry_policy)),
      rate_limiter_(std::move(rate_limiter)),
      idempotency_guard_(std::move(idempotency_guard)),
      clock_(std::move(clock)),
      observer_(std::move(observer)),
      logger_(std::move(logger)) {
    if (!rate_limiter_) {
        throw std::invalid_argument("RateLimiter pointer cannot be null");
    }
    if (!idempotency_guard_) {
        throw std::invalid_argument("IdempotencyGuard pointer cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock pointer cannot be null");
    }
    if (!observer_) {
        throw std::invalid_argument("Observer pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (providers.empty()) {
        throw std::invalid_argument("At least one email provider must be configured");
    }

    std::unordered_set<std::string> seen_names;
    providers_.reserve(providers.size());
    for (auto& provider : providers) {
        if (!provider) {
            throw std::invalid_argument("Email provider pointer cannot be null");
        }
        std::string name = provider->name();
        if (name.empty()) {
            throw std::invalid_argument("Email provider name cannot be empty");
        }
        if (!seen_names.insert(name).second) {
            throw std::invalid_argument("Duplicate email provider name: " + name);
        }
        auto breaker = std::make_unique<CircuitBreaker>(name, breaker_config, clock_, observer_);
        providers_.push_back(ProviderSlot{std::move(provider), std::move(name), std::move(breaker)});
    }

    logger_->debug("FallbackOrchestrator initialized with " + std::to_string(providers_.size()) + " providers");
}

DeliveryOutcome FallbackOrchestrator::execute(const DeliveryRequest& request) {
    const auto started = clock_->now();
    const int64_t timestamp_ms = clock_->wallNowMs();

    if (!request.isComplete()) {
        return reject(DeliveryMessages::INVALID_REQUEST, timestamp_ms, request.requestId);
    }
    if (idempotency_guard_->isDuplicate(request.requestId)) {
        return reject(DeliveryMessages::DUPLICATE_REQUEST, timestamp_ms, request.requestId);
    }
    if (rate_limiter_->isLimited()) {
        return reject(DeliveryMessages::RATE_LIMITED, timestamp_ms, request.requestId);
    }

    unsigned int total_attempts = 0;
    std::vector<std::string> failure_reasons;
    failure_reasons.reserve(providers_.size());

    for (auto& slot : providers_) {
        const std::string& provider_name = slot.name;

        if (!slot.breaker->canExecute()) {
            observer_->onProviderDenied(provider_name, request.requestId);
            failure_reasons.push_back(provider_name + ": circuit breaker is " +
                                      circuitStateToString(slot.breaker->getStatus().state) + " - " +
                                      provider_name + " temporarily unavailable");
            continue;
        }

        RetryResult result;
        try {
            result = retry_policy_.execute(
                [this, &slot, &request](unsigned int attempt) {
                    observer_->onAttempt(slot.name, request.requestId, attempt);
                    slot.provider->attemptDelivery(request);
                },
                *clock_,
                [this, &slot, &request](unsigned int attempt, const std::string& error,
                                        std::optional<std::chrono::milliseconds> next_delay) {
                    observer_->onAttemptFailed(slot.name, request.requestId, attempt, error);
                    if (next_delay) {
                        observer_->onRetryScheduled(slot.name, request.requestId, *next_delay);
                    }
                });
        } catch (...) {
            // Settle the breaker, including a half-open trial, before propagating
            logger_->error("[FallbackOrchestrator] Delivery through " + provider_name + " aborted for request " +
                           request.requestId);
            slot.breaker->recordFailure();
            throw;
        }

        if (result.success) {
            slot.breaker->recordSuccess();
            idempotency_guard_->markComplete(request.requestId);

            DeliveryOutcome outcome(true, provider_name, result.attempts, std::nullopt,
                                    timestamp_ms, request.requestId);
            observer_->onDeliveryCompleted(outcome,
                std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started));
            return outcome;
        }

        slot.breaker->recordFailure();
        total_attempts += result.attempts;
        failure_reasons.push_back(provider_name + ": " + result.last_error);

        logger_->debug("[FallbackOrchestrator] " + provider_name + " exhausted for request " +
                       request.requestId + ", falling back to next provider");
    }

    std::ostringstream error_message;
    for (size_t i = 0; i < failure_reasons.size(); ++i) {
        if (i > 0) {
            error_message << "; ";
        }
        error_message << failure_reasons[i];
    }

    DeliveryOutcome outcome(false, DeliveryMessages::NO_PROVIDER, total_attempts, error_message.str(),
                            timestamp_ms, request.requestId);
    observer_->onDeliveryCompleted(outcome,
        std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started));
    return outcome;
}

bool FallbackOrchestrator::isAnyProviderAvailable() const {
    for (const auto& slot : providers_) {
        if (slot.breaker->isAvailable()) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> FallbackOrchestrator::getBestAvailableProvider() const {
    for (const auto& slot : providers_) {
        if (slot.breaker->isAvailable()) {
            return slot.name;
        }
    }
    return std::nullopt;
}

std::vector<CircuitBreakerStatus> FallbackOrchestrator::getCircuitBreakerStatus() const {
    std::vector<CircuitBreakerStatus> statuses;
    statuses.reserve(providers_.size());
    for (const auto& slot : providers_) {
        statuses.push_back(slot.breaker->getStatus());
    }
    return statuses;
}

void FallbackOrchestrator::resetCircuitBreakers() {
    logger_->info("[FallbackOrchestrator] Manually resetting all circuit breakers");
    for (auto& slot : providers_) {
        slot.breaker->reset();
    }
}

RateLimitStatus FallbackOrchestrator::getRateLimitStatus() const {
    return rate_limiter_->getStatus();
}

ServiceStatus FallbackOrchestrator::getServiceStatus() const {
    ServiceStatus status;
    for (const auto& slot : providers_) {
        status.providers.push_back(slot.name);
    }
    status.max_attempts = retry_policy_.maxAttempts();
    status.base_delay = retry_policy_.baseDelay();
    return status;
}

DeliveryOutcome FallbackOrchestrator::reject(const std::string& reason, int64_t timestamp_ms,
                                             const std::string& request_id) const {
    observer_->onRequestRejected(request_id, reason);
    return DeliveryOutcome::rejected(reason, timestamp_ms, request_id);
}
