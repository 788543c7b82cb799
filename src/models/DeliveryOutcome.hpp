#ifndef DELIVERYOUTCOME_HPP
#define DELIVERYOUTCOME_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace DeliveryMessages {
    static const std::string INVALID_REQUEST = "invalid request: missing required fields";
    static const std::string DUPLICATE_REQUEST = "duplicate request";
    static const std::string RATE_LIMITED = "rate limit exceeded";
    static const std::string NO_PROVIDER = "none"; // providerUsed when every provider failed
}

// --- Result of one FallbackOrchestrator::execute call ---
class DeliveryOutcome {
public:
    DeliveryOutcome(bool success,
                    std::optional<std::string> provider_used,
                    unsigned int attempts,
                    std::optional<std::string> error_message,
                    int64_t timestamp_ms,
                    std::string request_id)
        : success_(success),
          provider_used_(std::move(provider_used)),
          attempts_(attempts),
          error_message_(std::move(error_message)),
          timestamp_ms_(timestamp_ms),
          request_id_(std::move(request_id)) {}

    // Zero-attempt rejection (invalid input, duplicate id, rate limit)
    static DeliveryOutcome rejected(const std::string& reason, int64_t timestamp_ms, const std::string& request_id) {
        return DeliveryOutcome(false, std::nullopt, 0, reason, timestamp_ms, request_id);
    }

    bool success() const { return success_; }
    const std::optional<std::string>& providerUsed() const { return provider_used_; }
    unsigned int attempts() const { return attempts_; }
    const std::optional<std::string>& errorMessage() const { return error_message_; }
    int64_t timestampMs() const { return timestamp_ms_; }
    const std::string& requestId() const { return request_id_; }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "DeliveryOutcome { requestId: " << request_id_
            << ", success: " << std::boolalpha << success_
            << ", providerUsed: " << provider_used_.value_or("-")
            << ", attempts: " << attempts_;
        if (error_message_) {
            oss << ", error: " << *error_message_;
        }
        oss << " }";
        return oss.str();
    }

private:
    bool success_;
    std::optional<std::string> provider_used_;
    unsigned int attempts_;
    std::optional<std::string> error_message_;
    int64_t timestamp_ms_;
    std::string request_id_;
};

#endif // DELIVERYOUTCOME_HPP
