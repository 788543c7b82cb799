#ifndef RETRYPOLICY_HPP
#define RETRYPOLICY_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/IClock.hpp"

struct RetryResult {
    bool success = false;
    unsigned int attempts = 0;
    std::string last_error;
};

// Bounded attempts with exponential backoff: no delay before the first attempt,
// then base, 2*base, 4*base ... capped at max_delay. No delay after the last attempt.
class RetryPolicy {
public:
    // attempt is 1-based; next_delay is empty when no further attempt will be made
    using FailureCallback = std::function<void(unsigned int attempt,
                                               const std::string& error,
                                               std::optional<std::chrono::milliseconds> next_delay)>;

    explicit RetryPolicy(unsigned int max_attempts = 3,
                         std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000),
                         std::chrono::milliseconds max_delay = std::chrono::milliseconds(60000));

    // Delay to wait before the 0-indexed attempt. Saturates at max_delay.
    std::chrono::milliseconds delayBeforeAttempt(unsigned int attempt) const;

    // Delays between consecutive attempts, max_attempts - 1 entries
    std::vector<std::chrono::milliseconds> delaySchedule() const;

    // Runs operation until it returns without throwing or the attempts are
    // exhausted. Anything thrown by operation counts as a failed attempt;
    // exceptions from on_failure or clock.sleepFor propagate to the caller.
    RetryResult execute(const std::function<void(unsigned int attempt)>& operation,
                        IClock& clock,
                        const FailureCallback& on_failure = nullptr) const;

    unsigned int maxAttempts() const { return max_attempts_; }
    std::chrono::milliseconds baseDelay() const { return base_delay_; }
    std::chrono::milliseconds maxDelay() const { return max_delay_; }

private:
    unsigned int max_attempts_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

#endif // RETRYPOLICY_HPP
