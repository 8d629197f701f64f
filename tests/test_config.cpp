/**
 * @file test_config.cpp
 * @brief ConfigStore parsing, GateConfig loading and validation
 */

#include <gtest/gtest.h>
#include "kg_config.hpp"

#include <cstdio>
#include <limits>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace kg;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) std::remove(path_.c_str());
    }

    std::string write_file(const std::string& content) {
        path_ = "/tmp/knockgate_test_" + std::to_string(getpid()) + ".conf";
        std::ofstream out(path_);
        out << content;
        return path_;
    }

    std::string path_;
};

// ==================== Sequence parsing ====================

TEST_F(ConfigTest, ParsesPortSequence) {
    EXPECT_EQ(parse_port_sequence("1234,5678,9012"),
              (std::vector<uint16_t>{1234, 5678, 9012}));
    EXPECT_EQ(parse_port_sequence(" 7000 , 8000 "), (std::vector<uint16_t>{7000, 8000}));
    EXPECT_EQ(parse_port_sequence("65535"), (std::vector<uint16_t>{65535}));
}

TEST_F(ConfigTest, RejectsMalformedSequences) {
    EXPECT_THROW(parse_port_sequence(""), ConfigError);
    EXPECT_THROW(parse_port_sequence("1234,,9012"), ConfigError);
    EXPECT_THROW(parse_port_sequence("1234,abc"), ConfigError);
    EXPECT_THROW(parse_port_sequence("1234,5678x"), ConfigError);
    EXPECT_THROW(parse_port_sequence("0,1234"), ConfigError);
    EXPECT_THROW(parse_port_sequence("70000"), ConfigError);
    EXPECT_THROW(parse_port_sequence("-5"), ConfigError);
}

TEST_F(ConfigTest, FormatsSequence) {
    EXPECT_EQ(format_port_sequence({1234, 5678, 9012}), "1234,5678,9012");
}

// ==================== Store ====================

TEST_F(ConfigTest, StoreHasDefaults) {
    ConfigStore store;
    EXPECT_EQ(store.get("knock.sequence"), "1234,5678,9012");
    EXPECT_EQ(store.getInt("gate.protected_port"), 2222);
    EXPECT_DOUBLE_EQ(store.getDouble("knock.window_sec"), 10.0);
    EXPECT_DOUBLE_EQ(store.getDouble("gate.open_ttl_sec"), 30.0);
}

TEST_F(ConfigTest, StrictTypedGetters) {
    ConfigStore store;
    store.set("x.int", "12abc");
    store.set("x.double", "ten");
    store.set("x.bool", "maybe");
    EXPECT_THROW(store.getInt("x.int"), ConfigError);
    EXPECT_THROW(store.getDouble("x.double"), ConfigError);
    EXPECT_THROW(store.getBool("x.bool"), ConfigError);
    EXPECT_EQ(store.getInt("missing.key", 9), 9);
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    ConfigStore store;
    store.loadFromFile(write_file(
        "# knock settings\n"
        "knock.sequence = 7000, 8000, 9000\n"
        "\n"
        "; gate\n"
        "gate.protected_port=2200\n"
        "gate.open_ttl_sec = 5.5\n"));

    GateConfig cfg = GateConfig::from_store(store);
    EXPECT_EQ(cfg.sequence, (std::vector<uint16_t>{7000, 8000, 9000}));
    EXPECT_EQ(cfg.protected_port, 2200);
    EXPECT_DOUBLE_EQ(cfg.open_ttl_sec, 5.5);
    EXPECT_DOUBLE_EQ(cfg.window_sec, 10.0);
}

TEST_F(ConfigTest, RejectsMalformedFile) {
    ConfigStore store;
    EXPECT_THROW(store.loadFromFile(write_file("knock.sequence 1234\n")), ConfigError);
    EXPECT_THROW(store.loadFromFile("/nonexistent/knockgate.conf"), ConfigError);
}

// ==================== GateConfig ====================

TEST_F(ConfigTest, DefaultGateConfigIsValid) {
    GateConfig cfg = GateConfig::from_store(ConfigStore());
    EXPECT_EQ(cfg.validate(), ValidationError::NONE);
    EXPECT_EQ(cfg.sequence, (std::vector<uint16_t>{1234, 5678, 9012}));
    EXPECT_EQ(cfg.protected_port, 2222);
    EXPECT_EQ(cfg.revoke_attempts, 5);
    EXPECT_EQ(cfg.log_level, LogLevel::INFO);
}

TEST_F(ConfigTest, ValidationCatchesBadValues) {
    GateConfig cfg;
    cfg.sequence = {};
    EXPECT_EQ(cfg.validate(), ValidationError::EMPTY_SEQUENCE);

    cfg = GateConfig();
    cfg.sequence = {1234, 1234};
    EXPECT_EQ(cfg.validate(), ValidationError::DUPLICATE_KNOCK_PORT);

    cfg = GateConfig();
    cfg.protected_port = 5678;
    EXPECT_EQ(cfg.validate(), ValidationError::PROTECTED_PORT_IN_SEQUENCE);

    cfg = GateConfig();
    cfg.window_sec = 0.0;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_WINDOW);

    cfg = GateConfig();
    cfg.open_ttl_sec = -1.0;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_TTL);

    cfg = GateConfig();
    cfg.revoke_attempts = 0;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_REVOKE_ATTEMPTS);
}

TEST_F(ConfigTest, DurationsHaveUpperBound) {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    GateConfig cfg;
    cfg.window_sec = kMaxDurationSec;
    cfg.open_ttl_sec = kMaxDurationSec;
    cfg.sweep_interval_sec = kMaxDurationSec;
    EXPECT_EQ(cfg.validate(), ValidationError::NONE);

    cfg = GateConfig();
    cfg.window_sec = 1e10;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_WINDOW);
    cfg.window_sec = inf;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_WINDOW);
    cfg.window_sec = nan;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_WINDOW);

    cfg = GateConfig();
    cfg.open_ttl_sec = 1e10;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_TTL);
    cfg.open_ttl_sec = inf;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_TTL);

    cfg = GateConfig();
    cfg.sweep_interval_sec = 1e10;
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_SWEEP_INTERVAL);
}

TEST_F(ConfigTest, HugeTtlFromFileFailsValidation) {
    ConfigStore store;
    store.set("gate.open_ttl_sec", "1e10");
    store.set("knock.window_sec", "inf");
    GateConfig cfg = GateConfig::from_store(store);
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_WINDOW);

    store.set("knock.window_sec", "10");
    cfg = GateConfig::from_store(store);
    EXPECT_EQ(cfg.validate(), ValidationError::INVALID_TTL);
}

TEST_F(ConfigTest, IntegerSettingsDoNotWrap) {
    ConfigStore store;
    store.set("gate.revoke_attempts", "4294967297");
    EXPECT_THROW(GateConfig::from_store(store), ConfigError);

    store = ConfigStore();
    store.set("listener.backlog", "-4294967296");
    EXPECT_THROW(GateConfig::from_store(store), ConfigError);

    store = ConfigStore();
    store.set("gate.revoke_attempts", "7");
    EXPECT_EQ(GateConfig::from_store(store).revoke_attempts, 7);
}

TEST_F(ConfigTest, UnknownLogLevelIsConfigError) {
    ConfigStore store;
    store.set("log.level", "loud");
    EXPECT_THROW(GateConfig::from_store(store), ConfigError);
}

TEST_F(ConfigTest, NonNumericWindowIsConfigError) {
    ConfigStore store;
    store.set("knock.window_sec", "soon");
    EXPECT_THROW(GateConfig::from_store(store), ConfigError);
}

TEST_F(ConfigTest, ValidationMessagesAreDistinct) {
    EXPECT_STREQ(validation_error_to_string(ValidationError::NONE), "ok");
    EXPECT_STRNE(validation_error_to_string(ValidationError::INVALID_WINDOW),
                 validation_error_to_string(ValidationError::INVALID_TTL));
}
