#ifndef RATELIMITER_HPP
#define RATELIMITER_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "../interfaces/IClock.hpp"
#include "../models/RateLimitStatus.hpp"

// Sliding-window admission gate. Only admitted requests are recorded, so at most
// max_requests are admitted in any window_size-long interval.
class RateLimiter {
public:
    RateLimiter(size_t max_requests, std::chrono::milliseconds window_size, std::shared_ptr<IClock> clock);

    // true = rejected (not recorded); false = admitted and counted
    bool isLimited();

    // Counts in-window admissions with the same predicate as isLimited(), without pruning.
    RateLimitStatus getStatus() const;

private:
    bool isExpired(std::chrono::steady_clock::time_point timestamp,
                   std::chrono::steady_clock::time_point now) const {
        return now - timestamp >= window_size_;
    }

    const size_t max_requests_;
    const std::chrono::milliseconds window_size_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    std::deque<std::chrono::steady_clock::time_point> timestamps_; // Oldest first
};

#endif // RATELIMITER_HPP
