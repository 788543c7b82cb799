#pragma once

#include <chrono>
#include <cstdint>

// Time source for breakers, the rate limiter and retry delays.
class IClock {
public:
    virtual ~IClock() = default;

    // Monotonic time used for every interval computation
    virtual std::chrono::steady_clock::time_point now() const = 0;

    // Wall-clock time, used for timestamps reported to callers
    virtual std::chrono::system_clock::time_point wallNow() const = 0;

    // Blocks the calling invocation for the given delay
    virtual void sleepFor(std::chrono::milliseconds delay) = 0;

    int64_t wallNowMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(wallNow().time_since_epoch()).count();
    }
};
