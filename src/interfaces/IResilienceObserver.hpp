#pragma once

#include <chrono>
#include <string>

#include "../models/CircuitBreakerStatus.hpp"
#include "../models/DeliveryOutcome.hpp"

// Receives structured events from the breakers and the orchestrator.
// Implementations must be thread-safe; events arrive from every worker thread.
class IResilienceObserver {
public:
    virtual ~IResilienceObserver() = default;

    virtual void onCircuitStateChange(const std::string& provider, CircuitState from, CircuitState to) = 0;
    virtual void onFailureRecorded(const std::string& provider, unsigned int failure_count, unsigned int threshold) = 0;

    virtual void onAttempt(const std::string& provider, const std::string& request_id, unsigned int attempt) = 0;
    virtual void onAttemptFailed(const std::string& provider, const std::string& request_id,
                                 unsigned int attempt, const std::string& error) = 0;
    virtual void onRetryScheduled(const std::string& provider, const std::string& request_id,
                                  std::chrono::milliseconds delay) = 0;
    virtual void onProviderDenied(const std::string& provider, const std::string& request_id) = 0;

    virtual void onRequestRejected(const std::string& request_id, const std::string& reason) = 0;
    virtual void onDeliveryCompleted(const DeliveryOutcome& outcome, std::chrono::milliseconds elapsed) = 0;
};
