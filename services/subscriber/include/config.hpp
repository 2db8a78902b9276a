#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MqttConfig {
    std::string broker;
    int port{443};
    std::string transport{"websockets"}; // "websockets" | "tcp"
    std::string username{"everyone"};
    std::string password{"everyone"};
    int qos{0};
};

struct Config {
    MqttConfig mqtt;
    std::vector<std::string> topics;
    std::string download_directory;
    int control_port{0};       // 0: let the OS pick
    int workers{0};            // 0: derive from core count
    long download_timeout_ms{0};
    int queue_report_interval_s{60};
    LogLevel log_level{LogLevel::Info};
};

std::string getenv_or(const char* key, const std::string& def);

// Parses and validates a config document; throws ConfigError.
Config parse_config(const std::string& text);
Config load_config(const std::string& path);

// Applies WIS2_CONTROL_PORT and WIS2_LOG_LEVEL; throws ConfigError.
void apply_env_overrides(Config& cfg);

// config.json next to the running executable.
std::string default_config_path(const char* argv0);
