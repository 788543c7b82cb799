// tests/test_logging_observer.cpp
#include <chrono>
#include <memory>
#include <stdexcept>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestHelpers.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/logging/LoggingObserver.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class LoggingObserverTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::unique_ptr<LoggingObserver> observer;

    void SetUp() override {
        ON_CALL(*logger, getLogLevel()).WillByDefault(Return(LogUtils::LogLevel::DEBUG));
        observer = std::make_unique<LoggingObserver>(logger, statsd);
    }
};

TEST_F(LoggingObserverTest, BreakerOpeningIsAWarning) {
    EXPECT_CALL(*logger, warn("[CircuitBreaker] SendGrid: CLOSED -> OPEN")).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CIRCUIT_BREAKER_OPENED + ".SendGrid", 1)).Times(1);

    observer->onCircuitStateChange("SendGrid", CircuitState::CLOSED, CircuitState::OPEN);
}

TEST_F(LoggingObserverTest, HalfOpenAnnouncesTestRequest) {
    EXPECT_CALL(*logger, info(HasSubstr("OPEN -> HALF_OPEN - allowing test request"))).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CIRCUIT_BREAKER_HALF_OPENED + ".Mailgun", 1)).Times(1);

    observer->onCircuitStateChange("Mailgun", CircuitState::OPEN, CircuitState::HALF_OPEN);
}

TEST_F(LoggingObserverTest, AttemptsAreCountedPerProvider) {
    EXPECT_CALL(*logger, debug(HasSubstr("Attempt 2 with SendGrid for request req-1"))).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::PROVIDER_ATTEMPT + ".SendGrid", 1)).Times(1);

    observer->onAttempt("SendGrid", "req-1", 2);
}

TEST_F(LoggingObserverTest, AttemptLogIsSkippedAboveDebug) {
    ON_CALL(*logger, getLogLevel()).WillByDefault(Return(LogUtils::LogLevel::INFO));
    EXPECT_CALL(*logger, debug(_)).Times(0);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::PROVIDER_ATTEMPT + ".SendGrid", 1)).Times(1);

    observer->onAttempt("SendGrid", "req-1", 1);
}

TEST_F(LoggingObserverTest, RejectionsMapToTheirCounters) {
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::REQUEST_DUPLICATE, 1)).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::REQUEST_RATE_LIMITED, 1)).Times(1);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::REQUEST_INVALID, 1)).Times(1);

    observer->onRequestRejected("req-1", DeliveryMessages::DUPLICATE_REQUEST);
    observer->onRequestRejected("req-2", DeliveryMessages::RATE_LIMITED);
    observer->onRequestRejected("", DeliveryMessages::INVALID_REQUEST);
}

TEST_F(LoggingObserverTest, CompletedDeliveryRecordsOutcomeAndLatency) {
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::DELIVERY_FAILED, 1)).Times(1);
    EXPECT_CALL(*statsd, timing(MetricsDefinitions::DELIVERY_LATENCY, std::chrono::milliseconds(6000))).Times(1);
    EXPECT_CALL(*logger, error(HasSubstr("All providers failed"))).Times(1);

    DeliveryOutcome outcome(false, std::string("none"), 6, std::string("SendGrid: boom; Mailgun: boom"), 0, "req-1");
    observer->onDeliveryCompleted(outcome, std::chrono::milliseconds(6000));
}

TEST_F(LoggingObserverTest, SuccessfulDeliveryIsInfo) {
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::DELIVERY_SUCCESS, 1)).Times(1);
    EXPECT_CALL(*logger, info(HasSubstr("providerUsed: Mailgun"))).Times(1);

    DeliveryOutcome outcome(true, std::string("Mailgun"), 2, std::nullopt, 0, "req-1");
    observer->onDeliveryCompleted(outcome, std::chrono::milliseconds(1000));
}

TEST_F(LoggingObserverTest, RejectsNullCollaborators) {
    EXPECT_THROW(LoggingObserver(nullptr, statsd), std::invalid_argument);
    EXPECT_THROW(LoggingObserver(logger, nullptr), std::invalid_argument);
}
