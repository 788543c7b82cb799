#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& stats_server_endpoint) {
    std::call_once(init_flag, [&config, logger, &stats_server_endpoint]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, stats_server_endpoint));
    });
    return instance;
}

std::pair<std::string, uint16_t> StatsDClient::parseEndpoint(const std::string& endpoint) {
    auto colon_pos = endpoint.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = endpoint.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    int port;
    try {
        size_t pos;
        std::string port_str = endpoint.substr(colon_pos + 1);
        port = std::stoi(port_str, &pos);
        if (pos != port_str.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Port out of range in STATSD_SERVER: " + std::to_string(port));
    }
    return {host, static_cast<uint16_t>(port)};
}

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(logger), udp_sender_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto endpoint = parseEndpoint(statsd_address);

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        endpoint.first,
        endpoint.second,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + endpoint.first + ":" + std::to_string(endpoint.second));
}

StatsDClient::~StatsDClient() = default;

void StatsDClient::send(const std::string& message) {
    udp_sender_->send(message);
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        const std::string& error = udp_sender_->errorMessage();
        if (!error.empty()) {
            logger_->debug("StatsDClient: last UDPSender error: " + error);
        }
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}
