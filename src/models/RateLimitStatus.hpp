#pragma once

#include <chrono>
#include <cstddef>

struct RateLimitStatus {
    size_t current_requests = 0;
    size_t max_requests = 0;
    std::chrono::milliseconds window_size{0};
};
