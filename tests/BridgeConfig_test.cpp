#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdio>
#include <fstream>
#include <map>
#include <unistd.h>

#include "davbridge/bridge_config.hpp"

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class BridgeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = "/tmp/davbridge_config_test_" + std::to_string(getpid()) + ".json";
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void writeConfig(const std::string & contents) {
        std::ofstream out(path);
        out << contents;
    }

    BridgeConfig::EnvLookup envFrom(std::map<std::string, std::string> values) {
        return [values](const std::string & key) {
            auto it = values.find(key);
            return it == values.end() ? std::string("") : it->second;
        };
    }

    BridgeConfig validConfig() {
        BridgeConfig config;
        config.kodbox.baseURL = "https://kodbox.example.com";
        config.kodbox.username = "admin";
        config.caldav.username = "alice";
        config.caldav.password = "secret";
        return config;
    }

    std::string path;
};

TEST_F(BridgeConfigTest, DefaultsWithoutFileOrEnvironment) {
    BridgeConfig config = BridgeConfig::load("", envFrom({}));
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 5082);
    EXPECT_EQ(config.sync.interval, std::chrono::seconds(300));
    EXPECT_EQ(config.sync.maxAttempts, 3);
    EXPECT_EQ(config.caldav.realm, "DAVBridge");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(BridgeConfigTest, FileValuesAreApplied) {
    writeConfig(R"({
        "kodbox": {"base_url": "https://kodbox.example.com/", "username": "admin", "password": "pw", "timeout": "15"},
        "caldav": {"username": "alice", "password": "secret", "public_tokens": ["a", "b"]},
        "server": {"host": "127.0.0.1", "port": 8080},
        "sync": {"interval_seconds": 60, "max_retries": 5, "eager": false, "history_depth": 10},
        "logging": {"level": "debug", "file_path": "/var/log/davbridge.log"}
    })");

    BridgeConfig config = BridgeConfig::load(path, envFrom({}));
    EXPECT_EQ(config.sourcePath, path);
    EXPECT_EQ(config.kodbox.baseURL, "https://kodbox.example.com/");
    EXPECT_EQ(config.kodbox.timeoutSeconds, 15);
    EXPECT_THAT(config.caldav.publicTokens, ElementsAre("a", "b"));
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.sync.interval, std::chrono::seconds(60));
    EXPECT_EQ(config.sync.maxAttempts, 5);
    EXPECT_FALSE(config.sync.eager);
    EXPECT_EQ(config.historyDepth, 10u);
    EXPECT_EQ(config.logging.filePath, "/var/log/davbridge.log");
    EXPECT_NO_THROW(config.validate(true));
}

TEST_F(BridgeConfigTest, EnvironmentOverridesFile) {
    writeConfig(R"({"kodbox": {"base_url": "https://file.example.com", "username": "file"}, "server": {"port": 8080}})");

    BridgeConfig config = BridgeConfig::load(path, envFrom({
        {"KODBOX_BASE_URL", "https://env.example.com"},
        {"SERVER_PORT", "9090"},
        {"CALDAV_PUBLIC_TOKENS", " x , y ,"},
        {"SYNC_INTERVAL", "120"},
        {"LOG_LEVEL", "warning"},
    }));

    EXPECT_EQ(config.kodbox.baseURL, "https://env.example.com");
    EXPECT_EQ(config.kodbox.username, "file");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_THAT(config.caldav.publicTokens, ElementsAre("x", "y"));
    EXPECT_EQ(config.sync.interval, std::chrono::seconds(120));
    EXPECT_EQ(config.logging.level, "warning");
}

TEST_F(BridgeConfigTest, UpstreamTimeoutFollowsKodBoxTimeout) {
    writeConfig(R"({"kodbox": {"base_url": "https://kodbox.example.com", "username": "admin", "timeout": 90}})");
    BridgeConfig config = BridgeConfig::load(path, envFrom({}));
    EXPECT_EQ(config.sync.upstreamTimeout, std::chrono::seconds(90));

    config = BridgeConfig::load(path, envFrom({{"KODBOX_TIMEOUT", "120"}}));
    EXPECT_EQ(config.sync.upstreamTimeout, std::chrono::seconds(120));
    EXPECT_EQ(config.toJSON()["sync"]["upstream_timeout_seconds"], 120);
}

TEST_F(BridgeConfigTest, ExplicitUpstreamTimeoutWins) {
    writeConfig(R"({
        "kodbox": {"base_url": "https://kodbox.example.com", "username": "admin", "timeout": 90},
        "sync": {"upstream_timeout_seconds": 45}
    })");
    BridgeConfig config = BridgeConfig::load(path, envFrom({{"KODBOX_TIMEOUT", "120"}}));
    EXPECT_EQ(config.kodbox.timeoutSeconds, 120);
    EXPECT_EQ(config.sync.upstreamTimeout, std::chrono::seconds(45));

    config = BridgeConfig::load(path, envFrom({{"SYNC_UPSTREAM_TIMEOUT", "0"}}));
    try {
        config.validate(false);
        FAIL() << "expected a zero upstream timeout to be rejected";
    } catch (ConfigException & ex) {
        EXPECT_THAT(ex.what(), HasSubstr("upstream_timeout_seconds"));
    }
}

TEST_F(BridgeConfigTest, RejectsBadValues) {
    EXPECT_THROW(BridgeConfig::load("", envFrom({{"SERVER_PORT", "http"}})), ConfigException);
    EXPECT_THROW(BridgeConfig::load("", envFrom({{"SERVER_PORT", "70000"}})), ConfigException);
    EXPECT_THROW(BridgeConfig::load("", envFrom({{"SYNC_INTERVAL", "5m"}})), ConfigException);

    writeConfig(R"({"server": {"port": 70000}})");
    EXPECT_THROW(BridgeConfig::load(path, envFrom({})), ConfigException);

    writeConfig(R"({"server": "8080"})");
    EXPECT_THROW(BridgeConfig::load(path, envFrom({})), ConfigException);

    writeConfig("{ not json");
    EXPECT_THROW(BridgeConfig::load(path, envFrom({})), ConfigException);

    EXPECT_THROW(BridgeConfig::load("/nonexistent/davbridge.json", envFrom({})), ConfigException);
}

TEST_F(BridgeConfigTest, ValidateRequiresUpstreamSettings) {
    BridgeConfig config = validConfig();
    EXPECT_NO_THROW(config.validate(true));

    config.kodbox.baseURL = "";
    EXPECT_THROW(config.validate(false), ConfigException);

    config = validConfig();
    config.kodbox.baseURL = "ftp://kodbox.example.com";
    EXPECT_THROW(config.validate(false), ConfigException);

    config = validConfig();
    config.sync.backoffCap = std::chrono::milliseconds(1000);
    EXPECT_THROW(config.validate(false), ConfigException);

    config = validConfig();
    config.logging.level = "verbose";
    EXPECT_THROW(config.validate(false), ConfigException);
}

TEST_F(BridgeConfigTest, ServingRequiresCalDAVCredentials) {
    BridgeConfig config = validConfig();
    config.caldav.password = "";
    EXPECT_NO_THROW(config.validate(false));
    EXPECT_THROW(config.validate(true), ConfigException);
}

TEST_F(BridgeConfigTest, DumpRedactsSecrets) {
    BridgeConfig config = validConfig();
    config.kodbox.password = "hunter2";
    config.caldav.publicTokens = {"feed"};

    std::string dumped = config.toJSON().dump();
    EXPECT_THAT(dumped, testing::Not(HasSubstr("hunter2")));
    EXPECT_THAT(dumped, testing::Not(HasSubstr("secret")));
    EXPECT_THAT(dumped, testing::Not(HasSubstr("feed")));
    EXPECT_EQ(config.toJSON()["caldav"]["public_tokens"].get<int>(), 1);
}
