#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "../interfaces/IClock.hpp"
#include "../interfaces/IResilienceObserver.hpp"
#include "../models/CircuitBreakerStatus.hpp"

// Per-provider breaker: CLOSED -> OPEN -> HALF_OPEN -> {CLOSED | OPEN}.
// Every public method is a single critical section.
class CircuitBreaker {
public:
    CircuitBreaker(std::string providerName,
                   CircuitBreakerConfig config,
                   std::shared_ptr<IClock> clock,
                   std::shared_ptr<IResilienceObserver> observer)
        : provider_name_(std::move(providerName)),
          config_(config),
          clock_(clock),
          observer_(observer) {
        if (!clock_) {
            throw std::invalid_argument("Clock cannot be null for CircuitBreaker");
        }
        if (!observer_) {
            throw std::invalid_argument("Observer cannot be null for CircuitBreaker");
        }
        if (config_.failure_threshold == 0) {
            throw std::invalid_argument("failure_threshold must be at least 1 for " + provider_name_);
        }
        if (config_.recovery_timeout.count() <= 0) {
            throw std::invalid_argument("recovery_timeout must be positive for " + provider_name_);
        }
        if (config_.monitoring_window.count() < 0) {
            throw std::invalid_argument("monitoring_window cannot be negative for " + provider_name_);
        }
    }

    // Decides admission for one call. An OPEN breaker whose recovery timeout has
    // elapsed moves to HALF_OPEN and grants the caller the single probe.
    bool canExecute();

    // Same answer canExecute() would give right now, without any state change.
    bool isAvailable() const;

    void recordSuccess();
    void recordFailure();

    CircuitBreakerStatus getStatus() const;

    // Administrative reset to CLOSED. Never called automatically.
    void reset();

    const std::string& providerName() const { return provider_name_; }

private:
    void notifyTransition(CircuitState from, CircuitState to) const;

    const std::string provider_name_;
    const CircuitBreakerConfig config_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IResilienceObserver> observer_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    unsigned int failure_count_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_failure_time_;
    std::chrono::steady_clock::time_point next_attempt_time_{};
    bool probe_in_flight_ = false;
};

#endif // CIRCUITBREAKER_HPP
