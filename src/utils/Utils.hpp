#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../models/ProviderSettings.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Parses "SendGrid:0.2,Mailgun:0.3" into providers in priority order.
    // A provider without ":rate" always succeeds.
    static optional<vector<ProviderSettings>> parseProviders(const std::string& value) {
        vector<ProviderSettings> providers;
        std::stringstream ss(value);
        std::string entry;
        while (getline(ss, entry, ',')) {
            entry = trim(entry);
            if (entry.empty()) {
                return nullopt;
            }
            ProviderSettings settings;
            size_t colonPos = entry.find(':');
            settings.name = trim(entry.substr(0, colonPos));
            if (settings.name.empty()) {
                return nullopt;
            }
            if (colonPos != string::npos) {
                auto rate = stringToDouble(trim(entry.substr(colonPos + 1)));
                if (!rate || *rate < 0.0 || *rate > 1.0) {
                    return nullopt;
                }
                settings.success_rate = *rate;
            }
            for (const auto& existing : providers) {
                if (existing.name == settings.name) {
                    return nullopt; // Names identify breakers, so they must be unique
                }
            }
            providers.push_back(std::move(settings));
        }
        if (providers.empty()) {
            return nullopt;
        }
        return providers;
    }

    // Applies one key=value setting. Invalid values keep the current setting.
    // Returns false when the key or value was rejected.
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << ". Keeping previous log level." << endl;
                return false;
            }
        }
        if (key == "providers") {
            if (auto parsed = parseProviders(value)) {
                config.providers = std::move(*parsed);
                return true;
            }
            cerr << "Warning: Invalid providers list: '" << value << "'. Expected Name:rate[,Name:rate...]" << endl;
            return false;
        }

        // Every remaining key takes an integer within [min, max]
        struct IntSetting {
            int AppConfig::* member;
            int min;
            int max;
        };
        static const int NO_MAX = std::numeric_limits<int>::max();
        static const std::map<std::string, IntSetting> intSettings = {
            {"frontend_port", {&AppConfig::frontend_port, 1, 65535}},
            {"metrics_batch_size", {&AppConfig::metrics_batch_size, 1, NO_MAX}},
            {"metrics_send_interval", {&AppConfig::metrics_send_interval_in_millis, 1, NO_MAX}},
            {"circuit_breaker_failure_threshold", {&AppConfig::circuit_breaker_failure_threshold, 1, NO_MAX}},
            {"circuit_breaker_recovery_timeout_ms", {&AppConfig::circuit_breaker_recovery_timeout_in_millis, 1, NO_MAX}},
            {"circuit_breaker_monitoring_window_ms", {&AppConfig::circuit_breaker_monitoring_window_in_millis, 0, NO_MAX}},
            {"retry_max_attempts", {&AppConfig::retry_max_attempts, 1, NO_MAX}},
            {"retry_base_delay_ms", {&AppConfig::retry_base_delay_in_millis, 0, NO_MAX}},
            {"retry_max_delay_ms", {&AppConfig::retry_max_delay_in_millis, 0, NO_MAX}},
            {"rate_limit_max_requests", {&AppConfig::rate_limit_max_requests, 1, NO_MAX}},
            {"rate_limit_window_ms", {&AppConfig::rate_limit_window_in_millis, 1, NO_MAX}},
        };

        auto val = stringToInt(value);
        auto it = intSettings.find(key);
        if (it != intSettings.end()) {
            const IntSetting& setting = it->second;
            if (!val || *val < setting.min || *val > setting.max) {
                cerr << "Warning: Invalid integer for " << key << ": " << value << endl;
                return false;
            }
            config.*(setting.member) = *val;
            return true;
        }

        if (key == "num_io_threads" || key == "worker_threads" || key == "max_response_queue_size") {
            if (!val || *val < 1) {
                cerr << "Warning: Invalid integer for " << key << ": " << value << endl;
                return false;
            }
            if (key == "num_io_threads") {
                config.num_io_threads = static_cast<unsigned int>(*val);
            } else if (key == "worker_threads") {
                config.worker_threads = static_cast<unsigned int>(*val);
            } else {
                config.max_response_queue_size = static_cast<size_t>(*val);
            }
            return true;
        }

        cerr << "Warning: Unknown configuration key: " << key << endl;
        return false;
    }

    // Load configuration from the config file, then command-line arguments on top
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        // Try multiple config file locations
        const std::string fileName = Constants::CONFIG_FILE_NAME;
        std::vector<std::string> config_paths = {
            fileName,                // Current directory
            "../" + fileName,        // Parent directory
            "/app/" + fileName,      // Docker container path
            "../../" + fileName      // Development path
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                std::string line;
                while (getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != string::npos && delimiterPos > 0) {
                        applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                    } else {
                        cerr << "Warning: Ignoring malformed line in " << config_path << ": " << line << endl;
                    }
                }
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        // Command-line arguments override the file
        for (const auto& pair : startupArguments) {
            applySetting(config, trim(pair.first), trim(pair.second));
        }

        if (config.retry_max_delay_in_millis < config.retry_base_delay_in_millis) {
            cerr << "Warning: retry_max_delay_ms is below retry_base_delay_ms. Raising it to " << config.retry_base_delay_in_millis << endl;
            config.retry_max_delay_in_millis = config.retry_base_delay_in_millis;
        }

        return config;
    }

    // Formats a wall-clock time as RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
    static std::string formatIsoTime(std::chrono::system_clock::time_point tp) {
        auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
        auto millis = since_epoch.count() % 1000;
        if (millis < 0) {
            millis += 1000;
        }
        std::time_t seconds = std::chrono::system_clock::to_time_t(
            tp - std::chrono::milliseconds(millis));

        std::tm tm = {};
    #if defined(_WIN32) || defined(_WIN64)
        gmtime_s(&tm, &seconds);
    #else
        gmtime_r(&seconds, &tm);
    #endif

        std::ostringstream oss;
        oss << std::put_time(&tm, Constants::TIME_FORMAT)
            << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return oss.str();
    }
};

#endif // UTILS_HPP
