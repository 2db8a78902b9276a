#include "config.hpp"
#include "output_path.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

template <typename T>
static T optional_field(const json& j, const char* key, T def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        throw ConfigError(std::string("config key '") + key + "' has the wrong type");
    }
}

static int parse_port(const std::string& v, const char* what) {
    try {
        size_t used = 0;
        int p = std::stoi(v, &used);
        if (used == v.size() && p >= 0 && p <= 65535) return p;
    } catch (const std::exception&) {
    }
    throw ConfigError(std::string(what) + " is not a valid port: " + v);
}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

Config parse_config(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError("config must be a JSON object");

    Config cfg;
    if (!j.contains("broker") || !j["broker"].is_string() || j["broker"].get<std::string>().empty()) {
        throw ConfigError("config needs a non-empty string 'broker'");
    }
    cfg.mqtt.broker = j["broker"].get<std::string>();

    if (!j.contains("topics") || !j["topics"].is_array()) {
        throw ConfigError("config needs a 'topics' array");
    }
    for (const auto& t : j["topics"]) {
        if (!t.is_string()) throw ConfigError("every entry of 'topics' must be a string");
        cfg.topics.push_back(t.get<std::string>());
    }

    if (!j.contains("download_directory") || !j["download_directory"].is_string()) {
        throw ConfigError("config needs a string 'download_directory'");
    }
    cfg.download_directory = j["download_directory"].get<std::string>();
    if (!directory_writable(cfg.download_directory)) {
        throw ConfigError("Specified download directory does not exist or is not writable: " + cfg.download_directory);
    }

    cfg.mqtt.port = optional_field(j, "broker_port", cfg.mqtt.port);
    cfg.mqtt.transport = optional_field(j, "transport", cfg.mqtt.transport);
    cfg.mqtt.username = optional_field(j, "username", cfg.mqtt.username);
    cfg.mqtt.password = optional_field(j, "password", cfg.mqtt.password);
    cfg.mqtt.qos = optional_field(j, "qos", cfg.mqtt.qos);
    cfg.control_port = optional_field(j, "control_port", cfg.control_port);
    cfg.workers = optional_field(j, "workers", cfg.workers);
    cfg.download_timeout_ms = optional_field(j, "download_timeout_ms", cfg.download_timeout_ms);
    cfg.queue_report_interval_s = optional_field(j, "queue_report_interval_s", cfg.queue_report_interval_s);

    if (cfg.mqtt.transport != "websockets" && cfg.mqtt.transport != "tcp") {
        throw ConfigError("unknown transport '" + cfg.mqtt.transport + "', expected websockets or tcp");
    }
    if (cfg.mqtt.qos < 0 || cfg.mqtt.qos > 2) throw ConfigError("qos must be 0, 1 or 2");
    if (cfg.mqtt.port <= 0 || cfg.mqtt.port > 65535) throw ConfigError("broker_port out of range");
    if (cfg.control_port < 0 || cfg.control_port > 65535) throw ConfigError("control_port out of range");
    if (cfg.workers < 0) throw ConfigError("workers must not be negative");
    if (cfg.download_timeout_ms < 0) throw ConfigError("download_timeout_ms must not be negative");
    if (cfg.queue_report_interval_s <= 0) throw ConfigError("queue_report_interval_s must be positive");

    std::string level = optional_field(j, "log_level", std::string("info"));
    auto parsed = parse_log_level(level);
    if (!parsed) throw ConfigError("unknown log_level '" + level + "'");
    cfg.log_level = *parsed;
    return cfg;
}

Config load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot read config file " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_config(ss.str());
}

void apply_env_overrides(Config& cfg) {
    std::string port = getenv_or("WIS2_CONTROL_PORT", "");
    if (!port.empty()) cfg.control_port = parse_port(port, "WIS2_CONTROL_PORT");
    std::string level = getenv_or("WIS2_LOG_LEVEL", "");
    if (!level.empty()) {
        auto parsed = parse_log_level(level);
        if (!parsed) throw ConfigError("unknown WIS2_LOG_LEVEL '" + level + "'");
        cfg.log_level = *parsed;
    }
}

std::string default_config_path(const char* argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) exe = std::filesystem::absolute(argv0 ? argv0 : ".", ec);
    return (exe.parent_path() / "config.json").string();
}
