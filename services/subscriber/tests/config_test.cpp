#include <gtest/gtest.h>
#include "config.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <fstream>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_temp_dir("wis2_config");
        unsetenv("WIS2_CONTROL_PORT");
        unsetenv("WIS2_LOG_LEVEL");
    }
    void TearDown() override {
        unsetenv("WIS2_CONTROL_PORT");
        unsetenv("WIS2_LOG_LEVEL");
        std::filesystem::remove_all(root_);
    }

    std::string base(const std::string& extra = "") {
        return R"({"broker": "globalbroker.meteo.fr", "topics": ["cache/a/wis2/+/data/core/#"],
                   "download_directory": ")" + root_.string() + "\"" + extra + "}";
    }

    std::filesystem::path root_;
};

TEST_F(ConfigTest, ParsesRequiredKeysWithDefaults) {
    Config cfg = parse_config(base());
    EXPECT_EQ(cfg.mqtt.broker, "globalbroker.meteo.fr");
    EXPECT_EQ(cfg.mqtt.port, 443);
    EXPECT_EQ(cfg.mqtt.transport, "websockets");
    EXPECT_EQ(cfg.mqtt.username, "everyone");
    ASSERT_EQ(cfg.topics.size(), 1u);
    EXPECT_EQ(cfg.download_directory, root_.string());
    EXPECT_EQ(cfg.control_port, 0);
    EXPECT_EQ(cfg.queue_report_interval_s, 60);
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, ParsesOptionalKeys) {
    Config cfg = parse_config(base(R"(, "control_port": 5050, "workers": 4, "qos": 1,
                                      "transport": "tcp", "broker_port": 8883, "log_level": "debug")"));
    EXPECT_EQ(cfg.control_port, 5050);
    EXPECT_EQ(cfg.workers, 4);
    EXPECT_EQ(cfg.mqtt.qos, 1);
    EXPECT_EQ(cfg.mqtt.transport, "tcp");
    EXPECT_EQ(cfg.mqtt.port, 8883);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, RejectsBadDocuments) {
    EXPECT_THROW(parse_config("not json"), ConfigError);
    EXPECT_THROW(parse_config(R"({"topics": [], "download_directory": "/tmp"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"broker": "b", "download_directory": "/tmp"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"broker": "b", "topics": [1], "download_directory": "/tmp"})"), ConfigError);
    EXPECT_THROW(parse_config(base(R"(, "qos": 3)")), ConfigError);
    EXPECT_THROW(parse_config(base(R"(, "transport": "udp")")), ConfigError);
    EXPECT_THROW(parse_config(base(R"(, "log_level": "loud")")), ConfigError);
    EXPECT_THROW(parse_config(base(R"(, "workers": "many")")), ConfigError);
}

TEST_F(ConfigTest, MissingDownloadDirectoryIsFatal) {
    std::string doc = R"({"broker": "b", "topics": [], "download_directory": ")" +
                      (root_ / "does-not-exist").string() + "\"}";
    EXPECT_THROW(parse_config(doc), ConfigError);
}

TEST_F(ConfigTest, LoadsFromFile) {
    auto path = root_ / "config.json";
    std::ofstream(path) << base();
    EXPECT_EQ(load_config(path.string()).mqtt.broker, "globalbroker.meteo.fr");
    EXPECT_THROW(load_config((root_ / "nope.json").string()), ConfigError);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    Config cfg = parse_config(base());
    setenv("WIS2_CONTROL_PORT", "8080", 1);
    setenv("WIS2_LOG_LEVEL", "warning", 1);
    apply_env_overrides(cfg);
    EXPECT_EQ(cfg.control_port, 8080);
    EXPECT_EQ(cfg.log_level, LogLevel::Warning);

    setenv("WIS2_CONTROL_PORT", "http", 1);
    EXPECT_THROW(apply_env_overrides(cfg), ConfigError);
}
