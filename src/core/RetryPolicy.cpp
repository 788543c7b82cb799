#include "RetryPolicy.hpp"

#include <cstdint>
#include <exception>
#include <stdexcept>

namespace {
    const std::string UNKNOWN_PROVIDER_ERROR = "unknown provider error";
}

RetryPolicy::RetryPolicy(unsigned int max_attempts,
                         std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay)
    : max_attempts_(max_attempts), base_delay_(base_delay), max_delay_(max_delay) {
    if (max_attempts_ == 0) {
        throw std::invalid_argument("RetryPolicy max_attempts must be at least 1");
    }
    if (base_delay_.count() < 0) {
        throw std::invalid_argument("RetryPolicy base_delay cannot be negative");
    }
    if (max_delay_ < base_delay_) {
        throw std::invalid_argument("RetryPolicy max_delay must not be smaller than base_delay");
    }
}

std::chrono::milliseconds RetryPolicy::delayBeforeAttempt(unsigned int attempt) const {
    if (attempt == 0 || base_delay_.count() == 0) {
        return std::chrono::milliseconds(0);
    }

    const unsigned int exponent = attempt - 1;
    const uint64_t base = static_cast<uint64_t>(base_delay_.count());
    const uint64_t cap = static_cast<uint64_t>(max_delay_.count());

    // base * 2^exponent > cap  <=>  base > cap >> exponent (shift-safe for exponent < 64)
    if (exponent >= 63 || base > (cap >> exponent)) {
        return max_delay_;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(base << exponent));
}

std::vector<std::chrono::milliseconds> RetryPolicy::delaySchedule() const {
    std::vector<std::chrono::milliseconds> schedule;
    schedule.reserve(max_attempts_ - 1);
    for (unsigned int attempt = 1; attempt < max_attempts_; ++attempt) {
        schedule.push_back(delayBeforeAttempt(attempt));
    }
    return schedule;
}

RetryResult RetryPolicy::execute(const std::function<void(unsigned int attempt)>& operation,
                                 IClock& clock,
                                 const FailureCallback& on_failure) const {
    RetryResult result;

    for (unsigned int attempt = 0; attempt < max_attempts_; ++attempt) {
        if (attempt > 0) {
            clock.sleepFor(delayBeforeAttempt(attempt));
        }
        result.attempts = attempt + 1;

        try {
            operation(result.attempts);
            result.success = true;
            result.last_error.clear();
            return result;
        } catch (const std::exception& e) {
            result.last_error = e.what();
            if (result.last_error.empty()) {
                result.last_error = UNKNOWN_PROVIDER_ERROR;
            }
        } catch (...) {
            result.last_error = UNKNOWN_PROVIDER_ERROR;
        }

        if (on_failure) {
            std::optional<std::chrono::milliseconds> next_delay;
            if (attempt + 1 < max_attempts_) {
                next_delay = delayBeforeAttempt(attempt + 1);
            }
            on_failure(result.attempts, result.last_error, next_delay);
        }
    }

    return result;
}
