#ifndef FALLBACKORCHESTRATOR_HPP
#define FALLBACKORCHESTRATOR_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CircuitBreaker.hpp"
#include "IdempotencyGuard.hpp"
#include "RateLimiter.hpp"
#include "RetryPolicy.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/IEmailProvider.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IResilienceObserver.hpp"
#include "../models/CircuitBreakerStatus.hpp"
#include "../models/DeliveryOutcome.hpp"
#include "../models/DeliveryRequest.hpp"
#include "../models/RateLimitStatus.hpp"
#include "../models/ServiceStatus.hpp"

// Sends a request through the providers in priority order. Each provider is
// guarded by its own CircuitBreaker and gets its own full RetryPolicy budget.
class FallbackOrchestrator {
public:
    FallbackOrchestrator(std::vector<std::shared_ptr<IEmailProvider>> providers,
                         CircuitBreakerConfig breaker_config,
                         RetryPolicy retry_policy,
                         std::shared_ptr<RateLimiter> rate_limiter,
                         std::shared_ptr<IdempotencyGuard> idempotency_guard,
                         std::shared_ptr<IClock> clock,
                         std::shared_ptr<IResilienceObserver> observer,
                         std::shared_ptr<ILogger> logger);

    // Delete copy/move operations; breakers are owned exclusively by this instance
    FallbackOrchestrator(const FallbackOrchestrator&) = delete;
    FallbackOrchestrator& operator=(const FallbackOrchestrator&) = delete;
    FallbackOrchestrator(FallbackOrchestrator&&) = delete;
    FallbackOrchestrator& operator=(FallbackOrchestrator&&) = delete;

    DeliveryOutcome execute(const DeliveryRequest& request);

    // Read-only: never moves a breaker out of OPEN or consumes a half-open probe.
    bool isAnyProviderAvailable() const;
    std::optional<std::string> getBestAvailableProvider() const;

    std::vector<CircuitBreakerStatus> getCircuitBreakerStatus() const; // Priority order
    void resetCircuitBreakers();

    RateLimitStatus getRateLimitStatus() const;
    ServiceStatus getServiceStatus() const;

private:
    struct ProviderSlot {
        std::shared_ptr<IEmailProvider> provider;
        std::string name;
        std::unique_ptr<CircuitBreaker> breaker;
    };

    DeliveryOutcome reject(const std::string& reason, int64_t timestamp_ms, const std::string& request_id) const;

    std::vector<ProviderSlot> providers_;
    const RetryPolicy retry_policy_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<IdempotencyGuard> idempotency_guard_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IResilienceObserver> observer_;
    std::shared_ptr<ILogger> logger_;
};

#endif // FALLBACKORCHESTRATOR_HPP
