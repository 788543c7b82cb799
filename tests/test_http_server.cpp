// tests/test_http_server.cpp
// End-to-end: a real BeastHttpServer on an ephemeral port, driven by cpp-httplib.
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestHelpers.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/BeastHttpServer.hpp"
#include "../src/core/EmailService.hpp"
#include "../src/core/SystemClock.hpp"
#include "../src/core/ThreadPoolQueue.hpp"

using json = nlohmann::json;
using ::testing::NiceMock;
using ::testing::Return;

class HttpServerTest : public ::testing::Test {
protected:
    AppConfig config;
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<NiceMock<MockResilienceObserver>> observer = std::make_shared<NiceMock<MockResilienceObserver>>();
    std::shared_ptr<EmailService> service;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_guard;
    std::shared_ptr<BeastHttpServer> server;
    std::thread io_thread;
    std::unique_ptr<httplib::Client> client;

    void SetUp() override {
        ON_CALL(*logger, getLogLevel()).WillByDefault(Return(LogUtils::LogLevel::INFO));
        config.providers = {ProviderSettings{"SendGrid", 1.0}, ProviderSettings{"Mailgun", 1.0}};
        config.rate_limit_max_requests = 3;

        auto orchestrator = EmailService::buildOrchestrator(config, std::make_shared<SystemClock>(), observer, logger);
        service = std::make_shared<EmailService>(orchestrator, std::make_shared<ThreadPoolQueue>(2, logger), statsd, logger);

        tcp::endpoint endpoint{net::ip::make_address("127.0.0.1"), 0};
        server = std::make_shared<BeastHttpServer>(ioc, endpoint, service, logger, config);
        server->run();

        work_guard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(ioc.get_executor());
        io_thread = std::thread([this]() { ioc.run(); });

        client = std::make_unique<httplib::Client>("127.0.0.1", server->port());
        client->set_read_timeout(5, 0);
    }

    void TearDown() override {
        client.reset();
        std::promise<void> stopped;
        net::post(ioc, [this, &stopped]() {
            server->stop();
            stopped.set_value();
        });
        stopped.get_future().wait_for(std::chrono::seconds(5));
        service->shutdown();
        work_guard.reset();
        ioc.stop();
        if (io_thread.joinable()) {
            io_thread.join();
        }
    }

    static std::string emailBody(const std::string& request_id) {
        return json{{"to", "user@example.com"}, {"subject", "Hi"}, {"body", "Hello"}, {"requestId", request_id}}.dump();
    }
};

TEST_F(HttpServerTest, SendEmailDeliversThroughPrimary) {
    auto res = client->Post("/send-email", emailBody("e2e-1"), "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
    json body = json::parse(res->body);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["providerUsed"], "SendGrid");
    EXPECT_EQ(body["attempts"], 1);
}

TEST_F(HttpServerTest, DuplicateAndRateLimitedRequestsAreRejected) {
    ASSERT_EQ(client->Post("/send-email", emailBody("e2e-1"), "application/json")->status, 200);

    auto duplicate = client->Post("/send-email", emailBody("e2e-1"), "application/json");
    ASSERT_TRUE(duplicate);
    EXPECT_EQ(duplicate->status, 400);
    EXPECT_EQ(json::parse(duplicate->body)["errorMessage"], "duplicate request");

    ASSERT_EQ(client->Post("/send-email", emailBody("e2e-2"), "application/json")->status, 200);
    auto limited = client->Post("/send-email", emailBody("e2e-3"), "application/json");
    ASSERT_TRUE(limited);
    EXPECT_EQ(limited->status, 400);
    EXPECT_EQ(json::parse(limited->body)["errorMessage"], "rate limit exceeded");
}

TEST_F(HttpServerTest, MalformedBodyIsRejected) {
    auto res = client->Post("/send-email", "not json", "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"], "Missing required fields: to, subject, body, requestId");
}

TEST_F(HttpServerTest, StatusEndpointsRespond) {
    auto health = client->Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(json::parse(health->body)["status"], "OK");

    auto breakers = client->Get("/circuit-breakers?verbose=1");
    ASSERT_TRUE(breakers);
    EXPECT_EQ(breakers->status, 200);
    EXPECT_EQ(json::parse(breakers->body)["circuitBreakers"]["Mailgun"]["state"], "CLOSED");

    auto providers = client->Get("/providers/status");
    ASSERT_TRUE(providers);
    EXPECT_EQ(json::parse(providers->body)["bestAvailableProvider"], "SendGrid");

    auto reset = client->Post("/admin/reset-circuit-breakers", "", "application/json");
    ASSERT_TRUE(reset);
    EXPECT_EQ(reset->status, 200);
}

TEST_F(HttpServerTest, UnknownRouteReturns404) {
    auto res = client->Get("/send-email");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(res->body, "The resource '/send-email' was not found.");
}

TEST_F(HttpServerTest, KeepAliveConnectionServesSeveralRequests) {
    client->set_keep_alive(true);
    for (int i = 0; i < 3; ++i) {
        auto res = client->Get("/health");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
    }
}
