#include "RateLimiter.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

RateLimiter::RateLimiter(size_t max_requests, std::chrono::milliseconds window_size, std::shared_ptr<IClock> clock)
    : max_requests_(max_requests), window_size_(window_size), clock_(clock) {
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for RateLimiter");
    }
    if (max_requests_ == 0) {
        throw std::invalid_argument("RateLimiter max_requests must be at least 1");
    }
    if (window_size_.count() <= 0) {
        throw std::invalid_argument("RateLimiter window_size must be positive");
    }
}

bool RateLimiter::isLimited() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();

    while (!timestamps_.empty() && isExpired(timestamps_.front(), now)) {
        timestamps_.pop_front();
    }

    if (timestamps_.size() >= max_requests_) {
        return true;
    }

    timestamps_.push_back(now);
    return false;
}

RateLimitStatus RateLimiter::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();

    // Timestamps are ordered, so everything after the first live entry is live too
    auto first_live = std::find_if(timestamps_.begin(), timestamps_.end(),
        [this, now](std::chrono::steady_clock::time_point ts) { return !isExpired(ts, now); });

    RateLimitStatus status;
    status.current_requests = static_cast<size_t>(std::distance(first_live, timestamps_.end()));
    status.max_requests = max_requests_;
    status.window_size = window_size_;
    return status;
}
