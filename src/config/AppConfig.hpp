#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <string>
#include <sstream>
#include <vector>

#include "../models/ProviderSettings.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "relayify.exception";

    static std::string JSON_ERROR = "relayify.json_error";

    // Per-attempt counters, suffixed with ".<provider>"
    static std::string PROVIDER_ATTEMPT = "relayify.provider.attempt";
    static std::string PROVIDER_ATTEMPT_FAILED = "relayify.provider.attempt_failed";
    static std::string PROVIDER_RETRY_SCHEDULED = "relayify.provider.retry";
    static std::string PROVIDER_DENIED = "relayify.provider.denied";

    // Breaker transitions, suffixed with ".<provider>"
    static std::string CIRCUIT_BREAKER_OPENED = "relayify.circuit.opened";
    static std::string CIRCUIT_BREAKER_HALF_OPENED = "relayify.circuit.half_opened";
    static std::string CIRCUIT_BREAKER_CLOSED = "relayify.circuit.closed";

    static std::string REQUEST_DUPLICATE = "relayify.request.duplicate";
    static std::string REQUEST_RATE_LIMITED = "relayify.request.rate_limited";
    static std::string REQUEST_INVALID = "relayify.request.invalid";

    static std::string DELIVERY_SUCCESS = "relayify.delivery.success";
    static std::string DELIVERY_FAILED = "relayify.delivery.failed";
    static std::string DELIVERY_LATENCY = "relayify.delivery.latency";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto CONFIG_FILE_NAME = "relayify.config";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Providers in priority order: primary first, then fallbacks
    std::vector<ProviderSettings> providers;

    // Server Configuration
    int frontend_port;
    unsigned int num_io_threads;
    unsigned int worker_threads;
    size_t max_response_queue_size;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Circuit Breaker (applied to every provider)
    int circuit_breaker_failure_threshold;
    int circuit_breaker_recovery_timeout_in_millis;
    int circuit_breaker_monitoring_window_in_millis;

    // Retry Policy (per provider)
    int retry_max_attempts;
    int retry_base_delay_in_millis;
    int retry_max_delay_in_millis;

    // Rate Limiter
    int rate_limit_max_requests;
    int rate_limit_window_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        frontend_port = 3000;
        num_io_threads = 2;
        worker_threads = 8;
        max_response_queue_size = 16;
        log_level = LogUtils::LogLevel::INFO;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;

        circuit_breaker_failure_threshold = 3;
        circuit_breaker_recovery_timeout_in_millis = 30000;
        circuit_breaker_monitoring_window_in_millis = 60000;

        retry_max_attempts = 3;
        retry_base_delay_in_millis = 1000;
        retry_max_delay_in_millis = 60000;

        rate_limit_max_requests = 10;
        rate_limit_window_in_millis = 60 * 1000;

        providers = {
            ProviderSettings{"SendGrid", 0.2},
            ProviderSettings{"Mailgun", 0.3}
        };
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "frontend_port: " << frontend_port << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "worker_threads: " << worker_threads << std::endl
            << "max_response_queue_size: " << max_response_queue_size << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Circuit Breaker --- //" << std::endl
            << "circuit_breaker_failure_threshold: " << circuit_breaker_failure_threshold << std::endl
            << "circuit_breaker_recovery_timeout_in_millis: " << circuit_breaker_recovery_timeout_in_millis << std::endl
            << "circuit_breaker_monitoring_window_in_millis: " << circuit_breaker_monitoring_window_in_millis << std::endl
            << "// --- Retry Policy --- //" << std::endl
            << "retry_max_attempts: " << retry_max_attempts << std::endl
            << "retry_base_delay_in_millis: " << retry_base_delay_in_millis << std::endl
            << "retry_max_delay_in_millis: " << retry_max_delay_in_millis << std::endl
            << "// --- Rate Limiter --- //" << std::endl
            << "rate_limit_max_requests: " << rate_limit_max_requests << std::endl
            << "rate_limit_window_in_millis: " << rate_limit_window_in_millis << std::endl;

        ss << "--- Providers (priority order) : success rate ---" << std::endl;
        for (const auto& provider : providers) {
            ss << provider.name << " : " << provider.success_rate << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
