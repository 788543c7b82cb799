#ifndef CIRCUITBREAKERSTATUS_HPP
#define CIRCUITBREAKERSTATUS_HPP

#include <chrono>
#include <optional>
#include <string>

enum class CircuitState {
    CLOSED,     // Requests flow normally
    OPEN,       // Requests are blocked until the recovery timeout elapses
    HALF_OPEN   // A single probe request tests recovery
};

inline const char* circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

struct CircuitBreakerConfig {
    unsigned int failure_threshold = 3;                       // Failures before tripping
    std::chrono::milliseconds recovery_timeout{30000};        // Wait before a probe is allowed
    std::chrono::milliseconds monitoring_window{60000};       // Failures older than this are forgotten
};

// Read-only snapshot returned by CircuitBreaker::getStatus()
struct CircuitBreakerStatus {
    std::string provider_name;
    CircuitState state = CircuitState::CLOSED;
    unsigned int failure_count = 0;
    // Wall-clock time of the next allowed probe; only set while OPEN
    std::optional<std::chrono::system_clock::time_point> next_attempt_time;
    CircuitBreakerConfig config;
};

#endif // CIRCUITBREAKERSTATUS_HPP
