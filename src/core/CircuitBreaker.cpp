#include "CircuitBreaker.hpp"

#include <chrono>
#include <string>

bool CircuitBreaker::canExecute() {
    bool allowed = false;
    bool moved_to_half_open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case CircuitState::CLOSED:
                allowed = true;
                break;
            case CircuitState::OPEN:
                if (clock_->now() >= next_attempt_time_) {
                    state_ = CircuitState::HALF_OPEN;
                    probe_in_flight_ = true;
                    moved_to_half_open = true;
                    allowed = true;
                }
                break;
            case CircuitState::HALF_OPEN:
                // Only one probe at a time; the next one is admitted once the
                // current probe has been recorded (which always leaves HALF_OPEN).
                if (!probe_in_flight_) {
                    probe_in_flight_ = true;
                    allowed = true;
                }
                break;
        }
    }

    if (moved_to_half_open) {
        try {
            notifyTransition(CircuitState::OPEN, CircuitState::HALF_OPEN);
        } catch (...) {
            // The caller never learns it holds the probe, so hand it back
            std::lock_guard<std::mutex> lock(mutex_);
            probe_in_flight_ = false;
            throw;
        }
    }
    return allowed;
}

bool CircuitBreaker::isAvailable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::CLOSED:
            return true;
        case CircuitState::OPEN:
            return clock_->now() >= next_attempt_time_;
        case CircuitState::HALF_OPEN:
            return !probe_in_flight_;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_count_ = 0;
        probe_in_flight_ = false;
        if (state_ == CircuitState::HALF_OPEN) {
            state_ = CircuitState::CLOSED;
            closed = true;
        }
    }

    if (closed) {
        notifyTransition(CircuitState::HALF_OPEN, CircuitState::CLOSED);
    }
}

void CircuitBreaker::recordFailure() {
    CircuitState previous_state;
    CircuitState new_state;
    unsigned int failure_count;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        previous_state = state_;

        // Failures separated by more than the monitoring window do not accumulate
        if (last_failure_time_ && (now - *last_failure_time_) > config_.monitoring_window) {
            failure_count_ = 0;
        }

        ++failure_count_;
        last_failure_time_ = now;

        if (failure_count_ >= config_.failure_threshold) {
            state_ = CircuitState::OPEN;
            next_attempt_time_ = now + config_.recovery_timeout;
        }

        // A failed probe always reopens the circuit
        if (previous_state == CircuitState::HALF_OPEN) {
            state_ = CircuitState::OPEN;
            next_attempt_time_ = now + config_.recovery_timeout;
        }

        probe_in_flight_ = false;
        new_state = state_;
        failure_count = failure_count_;
    }

    observer_->onFailureRecorded(provider_name_, failure_count, config_.failure_threshold);
    if (new_state != previous_state) {
        notifyTransition(previous_state, new_state);
    }
}

CircuitBreakerStatus CircuitBreaker::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStatus status;
    status.provider_name = provider_name_;
    status.state = state_;
    status.failure_count = failure_count_;
    status.config = config_;
    if (state_ == CircuitState::OPEN) {
        // Project the monotonic deadline onto the wall clock for reporting
        const auto remaining = next_attempt_time_ - clock_->now();
        status.next_attempt_time = clock_->wallNow() +
            std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining);
    }
    return status;
}

void CircuitBreaker::reset() {
    CircuitState previous_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous_state = state_;
        state_ = CircuitState::CLOSED;
        failure_count_ = 0;
        last_failure_time_.reset();
        next_attempt_time_ = {};
        probe_in_flight_ = false;
    }

    if (previous_state != CircuitState::CLOSED) {
        notifyTransition(previous_state, CircuitState::CLOSED);
    }
}

void CircuitBreaker::notifyTransition(CircuitState from, CircuitState to) const {
    observer_->onCircuitStateChange(provider_name_, from, to);
}
