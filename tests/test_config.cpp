#include <gtest/gtest.h>

#include <fstream>
#include <filesystem>

#include "config/config.hpp"

using namespace mavgw;
using namespace mavgw::config;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "mavgw_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string createFile(const std::string& name, const std::string& content) {
        std::string path = test_dir + "/" + name;
        std::ofstream file(path);
        file << content;
        return path;
    }
};

// CFG-001: Valid config loading
TEST_F(ConfigTest, LoadValidConfig) {
    std::string content = R"({
        "session": {
            "gcs_sysid": 200,
            "gcs_compid": 190,
            "target_sysid": 1,
            "allow_empty_data": true
        },
        "crc_extra": {
            "file": "/etc/mavgw/ardupilotmega.json"
        },
        "logging": {
            "level": "debug",
            "file": "/tmp/test.log"
        }
    })";

    auto path = createFile("valid.json", content);
    auto result = loadConfig(path);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value.session.gcs_sysid, 200);
    EXPECT_EQ(result.value.session.gcs_compid, 190);
    EXPECT_EQ(result.value.session.target_sysid, 1);
    EXPECT_TRUE(result.value.session.allow_empty_data);
    EXPECT_EQ(result.value.crc_extra_file, "/etc/mavgw/ardupilotmega.json");
    EXPECT_EQ(result.value.log_level, "debug");
    EXPECT_EQ(result.value.log_file, "/tmp/test.log");
}

// CFG-002: Default values for missing fields
TEST_F(ConfigTest, DefaultValuesForMissingFields) {
    std::string content = R"({
        "session": {
            "target_sysid": 7
        }
    })";

    auto path = createFile("partial.json", content);
    auto result = loadConfig(path);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value.session.target_sysid, 7);
    EXPECT_EQ(result.value.session.gcs_sysid, DEFAULT_GCS_SYSID);
    EXPECT_EQ(result.value.session.gcs_compid, DEFAULT_GCS_COMPID);
    EXPECT_FALSE(result.value.session.allow_empty_data);
    EXPECT_TRUE(result.value.crc_extra_file.empty());
}

// CFG-003: Invalid JSON syntax
TEST_F(ConfigTest, InvalidJsonSyntax) {
    std::string content = R"({ invalid json )";

    auto path = createFile("invalid.json", content);
    auto result = loadConfig(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::ConfigError);
}

// CFG-004: File not found
TEST_F(ConfigTest, FileNotFound) {
    auto result = loadConfig("/nonexistent/config.json");

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::ConfigError);
}

// CFG-005: Type mismatch (handled gracefully)
TEST_F(ConfigTest, TypeMismatch) {
    std::string content = R"({
        "session": {
            "gcs_sysid": "not_a_number"
        }
    })";

    auto path = createFile("typemismatch.json", content);
    auto result = loadConfig(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::ConfigError);
}

// CFG-006: IDs outside one byte are rejected
TEST_F(ConfigTest, IdOutOfRange) {
    auto high = loadConfig(createFile("high.json", R"({"session": {"gcs_sysid": 256}})"));
    EXPECT_FALSE(high.ok());
    EXPECT_EQ(high.error, ErrorCode::ConfigError);
    EXPECT_NE(high.message.find("gcs_sysid"), std::string::npos);

    auto negative = loadConfig(createFile("neg.json", R"({"session": {"target_sysid": -1}})"));
    EXPECT_FALSE(negative.ok());
    EXPECT_EQ(negative.error, ErrorCode::ConfigError);
}

// CFG-007: Boundary IDs are accepted
TEST_F(ConfigTest, IdBoundaries) {
    auto result = loadConfig(createFile("bounds.json",
        R"({"session": {"gcs_sysid": 0, "gcs_compid": 255, "target_sysid": 255}})"));

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value.session.gcs_sysid, 0);
    EXPECT_EQ(result.value.session.gcs_compid, 255);
    EXPECT_EQ(result.value.session.target_sysid, 255);
}

// Default config test
TEST_F(ConfigTest, GetDefaultConfig) {
    auto config = getDefaultConfig();

    EXPECT_EQ(config.session.gcs_sysid, 255);
    EXPECT_EQ(config.session.gcs_compid, 0);
    EXPECT_EQ(config.session.target_sysid, 0);
    EXPECT_FALSE(config.session.allow_empty_data);
    EXPECT_TRUE(config.crc_extra_file.empty());
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.log_file.empty());
}

// Empty config file uses defaults
TEST_F(ConfigTest, EmptyConfigUsesDefaults) {
    std::string content = "{}";

    auto path = createFile("empty.json", content);
    auto result = loadConfig(path);

    EXPECT_TRUE(result.ok());
    auto defaults = getDefaultConfig();
    EXPECT_EQ(result.value.session.gcs_sysid, defaults.session.gcs_sysid);
    EXPECT_EQ(result.value.session.target_sysid, defaults.session.target_sysid);
    EXPECT_EQ(result.value.log_level, defaults.log_level);
}

// Nested object missing
TEST_F(ConfigTest, NestedObjectMissing) {
    std::string content = R"({
        "logging": {
            "level": "warn"
        }
    })";

    auto path = createFile("nested.json", content);
    auto result = loadConfig(path);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value.log_level, "warn");
    EXPECT_EQ(result.value.session.gcs_sysid, DEFAULT_GCS_SYSID);
}
