#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace tangorest::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "tangorest_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    std::string config_path = create_config_file("empty.yaml", "{}\n");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.directory.device, "sys/database/2");
    EXPECT_DOUBLE_EQ(config.cache.ttl_seconds, 10.0);
    EXPECT_EQ(config.pool.max_handles, 100);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.simulation.devices.empty());
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
directory:
  device: sys/database/3
cache:
  ttl_seconds: 2.5
pool:
  max_handles: 16
logging:
  level: debug
simulation:
  devices:
    - name: a/b/c
      class: PowerSupply
      server: PowerSupply/1
      state: STANDBY
      properties:
        Description: a calibrated sensor
        Limits: ["0", "100"]
      attributes:
        - {name: Current, type: double, writable: read_write, value: "1.5", min: 0, max: 10, unit: A}
        - {name: Mode, type: enum, writable: read_write, enum_labels: [Off, Low, High], value: Low}
      commands:
        - {name: On}
        - Off
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.directory.device, "sys/database/3");
    EXPECT_DOUBLE_EQ(config.cache.ttl_seconds, 2.5);
    EXPECT_EQ(config.pool.max_handles, 16);
    EXPECT_EQ(config.logging.level, "debug");

    ASSERT_EQ(config.simulation.devices.size(), 1u);
    const auto &device = config.simulation.devices[0];
    EXPECT_EQ(device.class_name, "PowerSupply");
    EXPECT_EQ(device.state, "STANDBY");
    EXPECT_EQ(device.properties.at("Description"), std::vector<std::string>{"a calibrated sensor"});
    EXPECT_EQ(device.properties.at("Limits"), (std::vector<std::string>{"0", "100"}));

    ASSERT_EQ(device.attributes.size(), 2u);
    EXPECT_EQ(device.attributes[0].writable, "read_write");
    ASSERT_TRUE(device.attributes[0].max.has_value());
    EXPECT_DOUBLE_EQ(*device.attributes[0].max, 10.0);
    EXPECT_EQ(device.attributes[1].enum_labels.size(), 3u);

    ASSERT_EQ(device.commands.size(), 2u);
    EXPECT_EQ(device.commands[1].name, "Off");
    EXPECT_EQ(device.commands[1].in_type, "DevVoid");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    std::string config_path = create_config_file("unknown.yaml", R"(
cache:
  ttl_seconds: 5
  flavour: vanilla
http:
  port: 8080
)");
    ServiceConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_DOUBLE_EQ(config.cache.ttl_seconds, 5.0);
}

TEST_F(ConfigTest, RejectsNonPositiveTtl) {
    std::string config_path = create_config_file("ttl.yaml", "cache:\n  ttl_seconds: 0\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("ttl_seconds"), std::string::npos);
}

TEST_F(ConfigTest, RejectsUnboundedTtl) {
    std::string config_path = create_config_file("huge_ttl.yaml", "cache:\n  ttl_seconds: 1e300\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("ttl_seconds must be <="), std::string::npos);

    ServiceConfig week;
    week.cache.ttl_seconds = kMaxTtlSeconds;
    EXPECT_TRUE(validate_config(week, error)) << error;
}

TEST_F(ConfigTest, RejectsEmptyPool) {
    std::string config_path = create_config_file("pool.yaml", "pool:\n  max_handles: 0\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("max_handles"), std::string::npos);
}

TEST_F(ConfigTest, RejectsBadLogLevel) {
    std::string config_path = create_config_file("level.yaml", "logging:\n  level: chatty\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("chatty"), std::string::npos);
}

TEST_F(ConfigTest, RejectsMalformedDirectoryName) {
    std::string config_path = create_config_file("dir.yaml", "directory:\n  device: database\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("directory.device"), std::string::npos);
}

TEST_F(ConfigTest, RejectsUnknownAttributeType) {
    std::string config_path = create_config_file("type.yaml", R"(
simulation:
  devices:
    - name: a/b/c
      attributes:
        - {name: X, type: quaternion}
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("quaternion"), std::string::npos);
}

TEST_F(ConfigTest, RejectsUnknownWritable) {
    std::string config_path = create_config_file("writable.yaml", R"(
simulation:
  devices:
    - name: a/b/c
      attributes:
        - {name: X, writable: sometimes}
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("sometimes"), std::string::npos);
}

TEST_F(ConfigTest, RejectsDuplicateDevices) {
    std::string config_path = create_config_file("dup.yaml", R"(
simulation:
  devices:
    - name: a/b/c
    - name: a/b/c
)");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("twice"), std::string::npos);
}

TEST_F(ConfigTest, MissingFile) {
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "nope.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, InvalidYaml) {
    std::string config_path = create_config_file("broken.yaml", "cache: [unclosed\n");
    ServiceConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}
