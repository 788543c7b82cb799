#ifndef LOGGINGOBSERVER_HPP
#define LOGGINGOBSERVER_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IResilienceObserver.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Turns resilience events into log lines and StatsD metrics.
class LoggingObserver : public IResilienceObserver {
public:
    LoggingObserver(std::shared_ptr<ILogger> logger, std::shared_ptr<IStatsDClient> statsd_client)
        : logger_(logger), statsd_client_(statsd_client) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for LoggingObserver");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for LoggingObserver");
        }
    }

    ~LoggingObserver() override = default;

    void onCircuitStateChange(const std::string& provider, CircuitState from, CircuitState to) override;
    void onFailureRecorded(const std::string& provider, unsigned int failure_count, unsigned int threshold) override;

    void onAttempt(const std::string& provider, const std::string& request_id, unsigned int attempt) override;
    void onAttemptFailed(const std::string& provider, const std::string& request_id,
                         unsigned int attempt, const std::string& error) override;
    void onRetryScheduled(const std::string& provider, const std::string& request_id,
                          std::chrono::milliseconds delay) override;
    void onProviderDenied(const std::string& provider, const std::string& request_id) override;

    void onRequestRejected(const std::string& request_id, const std::string& reason) override;
    void onDeliveryCompleted(const DeliveryOutcome& outcome, std::chrono::milliseconds elapsed) override;

private:
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // LOGGINGOBSERVER_HPP
