// tests/test_utils.cpp
#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"key1=value1", "key2=value2"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("key1"), "value1");
    EXPECT_EQ(result->at("key2"), "value2");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    std::vector<std::string> args = {"keyvalue"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    std::vector<std::string> args = {"=value"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // The current implementation returns nullopt if *any* arg is invalid
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

// --- Tests for loadConfiguration ---

// Silences the warnings loadConfiguration prints for rejected settings
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

TEST(UtilsTest, LoadConfigurationDefaults) {
    std::map<std::string, std::string> args = {};
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.frontend_port, 3000);
    EXPECT_EQ(config.circuit_breaker_failure_threshold, 3);
    EXPECT_EQ(config.circuit_breaker_recovery_timeout_in_millis, 30000);
    EXPECT_EQ(config.circuit_breaker_monitoring_window_in_millis, 60000);
    EXPECT_EQ(config.retry_max_attempts, 3);
    EXPECT_EQ(config.retry_base_delay_in_millis, 1000);
    EXPECT_EQ(config.rate_limit_max_requests, 10);
    EXPECT_EQ(config.rate_limit_window_in_millis, 60000);
    ASSERT_EQ(config.providers.size(), 2u);
    EXPECT_EQ(config.providers[0], (ProviderSettings{"SendGrid", 0.2}));
    EXPECT_EQ(config.providers[1], (ProviderSettings{"Mailgun", 0.3}));
}

TEST(UtilsTest, LoadConfigurationOverrides) {
    std::map<std::string, std::string> args = {
        {"frontend_port", "8080"},
        {"worker_threads", "4"},
        {"log_level", "DEBUG"},
        {"circuit_breaker_failure_threshold", "5"},
        {"retry_base_delay_ms", "250"},
        {"rate_limit_max_requests", " 20 "},
        {"providers", "Primary:1,Backup:0.5"}
    };
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.frontend_port, 8080);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(config.circuit_breaker_failure_threshold, 5);
    EXPECT_EQ(config.retry_base_delay_in_millis, 250);
    EXPECT_EQ(config.rate_limit_max_requests, 20);
    ASSERT_EQ(config.providers.size(), 2u);
    EXPECT_EQ(config.providers[0].name, "Primary");
    EXPECT_EQ(config.providers[1].success_rate, 0.5);
}

TEST(UtilsTest, LoadConfigurationInvalidValueKeepsDefault) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {
        {"frontend_port", "abc"},
        {"circuit_breaker_failure_threshold", "0"},
        {"worker_threads", "-2"},
        {"log_level", "LOUD"},
        {"providers", "SendGrid:1.5"}
    };
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.frontend_port, 3000);
    EXPECT_EQ(config.circuit_breaker_failure_threshold, 3);
    EXPECT_EQ(config.worker_threads, 8u);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::INFO);
    EXPECT_EQ(config.providers.size(), 2u);
    EXPECT_NE(capture.str().find("Warning: Invalid integer for frontend_port"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationRaisesMaxDelayToBaseDelay) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {{"retry_base_delay_ms", "5000"}, {"retry_max_delay_ms", "2000"}};
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.retry_max_delay_in_millis, 5000);
}

TEST(UtilsTest, ApplySettingRejectsUnknownKey) {
    CerrCapture capture;
    AppConfig config;
    EXPECT_FALSE(Utils::applySetting(config, "country_backend", "US"));
    EXPECT_NE(capture.str().find("Unknown configuration key: country_backend"), std::string::npos);
}

TEST(UtilsTest, ApplySettingAllowsZeroBaseDelay) {
    AppConfig config;
    EXPECT_TRUE(Utils::applySetting(config, "retry_base_delay_ms", "0"));
    EXPECT_EQ(config.retry_base_delay_in_millis, 0);
    EXPECT_TRUE(Utils::applySetting(config, "max_response_queue_size", "32"));
    EXPECT_EQ(config.max_response_queue_size, 32u);
}

// --- Tests for parseProviders ---

TEST(UtilsTest, ParseProvidersKeepsPriorityOrder) {
    auto providers = Utils::parseProviders("SendGrid:0.2, Mailgun:0.3 ,Postmark");
    ASSERT_TRUE(providers.has_value());
    ASSERT_EQ(providers->size(), 3u);
    EXPECT_EQ((*providers)[0], (ProviderSettings{"SendGrid", 0.2}));
    EXPECT_EQ((*providers)[1], (ProviderSettings{"Mailgun", 0.3}));
    EXPECT_EQ((*providers)[2], (ProviderSettings{"Postmark", 1.0}));
}

TEST(UtilsTest, ParseProvidersRejectsMalformedLists) {
    EXPECT_FALSE(Utils::parseProviders("").has_value());
    EXPECT_FALSE(Utils::parseProviders("SendGrid,,Mailgun").has_value());
    EXPECT_FALSE(Utils::parseProviders(":0.5").has_value());
    EXPECT_FALSE(Utils::parseProviders("SendGrid:abc").has_value());
    EXPECT_FALSE(Utils::parseProviders("SendGrid:-0.1").has_value());
    EXPECT_FALSE(Utils::parseProviders("SendGrid:0.2,SendGrid:0.3").has_value());
}

// --- Tests for stringToLogLevel / trim ---

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("debug"), std::invalid_argument);
}

TEST(UtilsTest, TrimStripsWhitespace) {
    EXPECT_EQ(Utils::trim("  key \t"), "key");
    EXPECT_EQ(Utils::trim(" \r\n "), "");
    EXPECT_EQ(Utils::trim("a b"), "a b");
}

// --- Tests for formatIsoTime ---

TEST(UtilsTest, FormatIsoTimeUsesUtcWithMillis) {
    std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1704067230250)};
    EXPECT_EQ(Utils::formatIsoTime(tp), "2024-01-01T00:00:30.250Z");
}

TEST(UtilsTest, FormatIsoTimePadsMillis) {
    std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1704067200007)};
    EXPECT_EQ(Utils::formatIsoTime(tp), "2024-01-01T00:00:00.007Z");
}

TEST(UtilsTest, ApplySettingBoundsFrontendPort) {
    CerrCapture capture;
    AppConfig config;
    EXPECT_FALSE(Utils::applySetting(config, "frontend_port", "70000"));
    EXPECT_FALSE(Utils::applySetting(config, "frontend_port", "0"));
    EXPECT_EQ(config.frontend_port, 3000);
    EXPECT_TRUE(Utils::applySetting(config, "frontend_port", "65535"));
    EXPECT_EQ(config.frontend_port, 65535);
}
