#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/signal_set.hpp> // For graceful shutdown
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include "config/AppConfig.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/EmailService.hpp"
#include "core/FallbackOrchestrator.hpp"
#include "core/SystemClock.hpp"
#include "core/ThreadPoolQueue.hpp"
#include "logging/ConsoleLogger.hpp"
#include "logging/LoggingObserver.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using namespace std;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER not set. Metrics are disabled.");
        return DummyStatsDClient::getInstance();
    }

    logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);
    try {
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()) + ". Falling back to DummyStatsDClient.");
    }
    return DummyStatsDClient::getInstance();
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            cerr << LogUtils::CERROR_LOG_PREFIX << "Failed to parse command-line arguments for Relayify. Exiting." << endl;
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        // --- Delivery engine ---
        auto clock = std::make_shared<SystemClock>();
        auto observer = std::make_shared<LoggingObserver>(logger_, statsd_client);
        std::shared_ptr<FallbackOrchestrator> orchestrator =
            EmailService::buildOrchestrator(config_, clock, observer, logger_);
        auto worker_pool = std::make_shared<ThreadPoolQueue>(config_.worker_threads, logger_);
        auto email_service = std::make_shared<EmailService>(orchestrator, worker_pool, statsd_client, logger_);

        // --- Boost.Asio io_context for the HTTP boundary ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        auto const address = net::ip::make_address("0.0.0.0");
        auto const port = static_cast<unsigned short>(config_.frontend_port);
        auto beast_server = std::make_shared<BeastHttpServer>(
            ioc,
            tcp::endpoint{address, port},
            email_service,
            logger_,
            config_);
        beast_server->run();

        // Setup signal handling for graceful shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const& ec, int signal_number) {
                if (ec) {
                    logger_->error("Signal wait failed: " + ec.message());
                    return;
                }
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                beast_server->stop();
                email_service->shutdown(); // Lets in-flight deliveries finish
                work_guard.reset();
                ioc.stop();
            });

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.num_io_threads) + " I/O threads for Boost.Asio.");
        // The main thread runs the io_context too, so start one fewer
        for (unsigned int i = 1; i < config_.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in Boost.Asio I/O thread " + std::to_string(i) + ": " + e.what());
                }
                logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " exiting.");
            });
        }

        logger_->setup("Relayify listening on 0.0.0.0:" + std::to_string(beast_server->port()) + ". Press Ctrl+C to exit.");
        logger_->setup(" POST /send-email - Send an email");
        logger_->setup(" GET /health - Service status");
        logger_->setup(" GET /circuit-breakers - Circuit breaker status");
        logger_->setup(" POST /admin/reset-circuit-breakers - Reset circuit breakers");
        logger_->setup(" GET /providers/status - Provider availability status");

        try {
            ioc.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in main thread ioc.run(): " + std::string(e.what()));
        }

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("All Boost.Asio I/O threads joined. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        cerr << LogUtils::CERROR_LOG_PREFIX << "Unhandled exception: " << e.what() << endl;
        return 1;
    }
}
