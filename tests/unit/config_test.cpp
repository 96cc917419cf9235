#include "runtime/config.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace coderun::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / ("coderun_config_test_" + std::to_string(getpid()));
        fs::create_directories(temp_dir);
        unsetenv(kCloudApiKeyEnv);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
        unsetenv(kCloudApiKeyEnv);
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    bool load(const std::string& content, RuntimeConfig& config, std::string& error) {
        return load_config(create_config_file("config.yaml", content), config, error);
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    std::string config_content = R"(
providers:
  cloud:
    endpoint: https://sandbox.example.com
    api_key: k-123
)";

    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_TRUE(config.providers.cloud.enabled);
    EXPECT_EQ(config.providers.cloud.endpoint, "https://sandbox.example.com");
    EXPECT_EQ(config.providers.cloud.api_key, "k-123");
    EXPECT_FALSE(config.providers.container.enabled);  // no section, no provider

    // Defaults
    EXPECT_EQ(config.service.default_timeout_seconds, 30);
    EXPECT_EQ(config.service.max_output_bytes, 1024u * 1024u);
    EXPECT_EQ(config.http.port, 8090);
    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.health.failure_threshold, 3);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
service:
  default_timeout_seconds: 20
  max_output_bytes: 65536
  teardown_timeout_ms: 5000

http:
  enabled: true
  bind: 0.0.0.0
  port: 9000
  thread_pool_size: 8

health:
  probe_interval_ms: 10000
  probe_timeout_ms: 1500
  failure_threshold: 2

languages:
  aliases:
    snake: python

providers:
  cloud:
    priority: 5
    endpoint: http://localhost:7000
    execute_path: /run
    health_path: /ping
    network_margin_seconds: 3
    languages: [python, bash]
  container:
    priority: 50
    docker_binary: podman
    work_root: /var/tmp
    memory_mb: 512
    cpus: 1.5
    pids_limit: 64
    tmpfs_mb: 32
    allow_network: true
    images:
      python:
        image: python:3.12-slim
        command: python3 {file}
        filename: main.py

logging:
  level: debug
)";

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;

    EXPECT_EQ(config.service.default_timeout_seconds, 20);
    EXPECT_EQ(config.service.max_output_bytes, 65536u);
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 9000);
    EXPECT_EQ(config.http.thread_pool_size, 8);
    EXPECT_EQ(config.health.probe_interval_ms, 10000);
    EXPECT_EQ(config.health.probe_timeout_ms, 1500);
    EXPECT_EQ(config.health.failure_threshold, 2);
    EXPECT_EQ(config.languages.aliases.at("snake"), "python");

    const auto& cloud = config.providers.cloud;
    EXPECT_EQ(cloud.priority, 5);
    EXPECT_EQ(cloud.execute_path, "/run");
    EXPECT_EQ(cloud.health_path, "/ping");
    EXPECT_EQ(cloud.network_margin_seconds, 3);
    EXPECT_EQ(cloud.languages, (std::vector<std::string>{"python", "bash"}));

    const auto& container = config.providers.container;
    EXPECT_TRUE(container.enabled);
    EXPECT_EQ(container.priority, 50);
    EXPECT_EQ(container.docker_binary, "podman");
    EXPECT_EQ(container.work_root, "/var/tmp");
    EXPECT_EQ(container.memory_mb, 512);
    EXPECT_DOUBLE_EQ(container.cpus, 1.5);
    EXPECT_EQ(container.pids_limit, 64);
    EXPECT_EQ(container.tmpfs_mb, 32);
    EXPECT_TRUE(container.allow_network);
    ASSERT_EQ(container.images.size(), 1u);
    EXPECT_EQ(container.images.at("python").image, "python:3.12-slim");

    // Service limits flow into the adapters
    EXPECT_EQ(cloud.max_output_bytes, 65536u);
    EXPECT_EQ(container.max_output_bytes, 65536u);
    EXPECT_EQ(container.teardown_timeout_ms, 5000);

    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, LanguageNamesAreNormalized) {
    std::string config_content = R"(
providers:
  cloud:
    endpoint: http://localhost:7000
    languages: [Python, " BASH "]
  container:
    images:
      JavaScript:
        image: node:20-slim
        command: node {file}
        filename: main.js
)";

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_EQ(config.providers.cloud.languages, (std::vector<std::string>{"python", "bash"}));
    ASSERT_EQ(config.providers.container.images.size(), 1u);
    EXPECT_EQ(config.providers.container.images.count("javascript"), 1u);
}

TEST_F(ConfigTest, BlankLanguageNameFails) {
    std::string config_content = R"(
providers:
  cloud:
    endpoint: http://localhost:7000
    languages: [python, "  "]
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("languages"), std::string::npos) << error;
}

TEST_F(ConfigTest, ContainerGetsBuiltinImages) {
    std::string config_content = R"(
providers:
  container:
    enabled: true
)";

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_FALSE(config.providers.cloud.enabled);
    EXPECT_EQ(config.providers.container.images.size(), 10u);
    EXPECT_EQ(config.providers.container.images.count("rust"), 1u);
}

TEST_F(ConfigTest, ApiKeyFromEnvironment) {
    setenv(kCloudApiKeyEnv, "from-env", 1);

    std::string config_content = R"(
providers:
  cloud:
    endpoint: https://sandbox.example.com
)";

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_EQ(config.providers.cloud.api_key, "from-env");
}

TEST_F(ConfigTest, ConfigApiKeyWinsOverEnvironment) {
    setenv(kCloudApiKeyEnv, "from-env", 1);

    std::string config_content = R"(
providers:
  cloud:
    endpoint: https://sandbox.example.com
    api_key: from-file
)";

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_EQ(config.providers.cloud.api_key, "from-file");
}

TEST_F(ConfigTest, MissingProvidersSection) {
    std::string config_content = R"(
http:
  port: 8080
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("at least one provider"), std::string::npos) << error;
}

TEST_F(ConfigTest, AllProvidersDisabled) {
    std::string config_content = R"(
providers:
  cloud:
    enabled: false
    endpoint: https://sandbox.example.com
  container:
    enabled: false
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
}

TEST_F(ConfigTest, CloudWithoutEndpoint) {
    std::string config_content = R"(
providers:
  cloud:
    api_key: k
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("endpoint"), std::string::npos) << error;
}

TEST_F(ConfigTest, IncompleteImageSpec) {
    std::string config_content = R"(
providers:
  container:
    images:
      python:
        image: python:3.11-slim
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("python"), std::string::npos) << error;
}

TEST_F(ConfigTest, DefaultTimeoutOutOfRange) {
    std::string config_content = R"(
service:
  default_timeout_seconds: 120
providers:
  container: {}
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("default_timeout_seconds"), std::string::npos) << error;
}

TEST_F(ConfigTest, InvalidHealthSettings) {
    std::string config_content = R"(
health:
  probe_timeout_ms: 50
providers:
  container: {}
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("probe_timeout_ms"), std::string::npos) << error;
}

TEST_F(ConfigTest, InvalidContainerLimits) {
    std::string config_content = R"(
providers:
  container:
    cpus: 0
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("cpus"), std::string::npos) << error;
}

TEST_F(ConfigTest, InvalidHttpPort) {
    std::string config_content = R"(
http:
  port: 70000
providers:
  container: {}
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
}

TEST_F(ConfigTest, HttpDisabledSkipsPortCheck) {
    std::string config_content = R"(
http:
  enabled: false
  port: 0
providers:
  container: {}
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_TRUE(load(config_content, config, error)) << "Error: " << error;
    EXPECT_FALSE(config.http.enabled);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_content = R"(
providers:
  container: {}
logging:
  level: verbose
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("log level"), std::string::npos) << error;
}

TEST_F(ConfigTest, ValidLogLevels) {
    for (const std::string level : {"debug", "info", "warn", "error"}) {
        std::string config_content = "providers:\n  container: {}\nlogging:\n  level: " + level + "\n";

        RuntimeConfig config;
        std::string error;
        EXPECT_TRUE(load(config_content, config, error)) << level << ": " << error;
        EXPECT_EQ(config.logging.level, level);
    }
}

TEST_F(ConfigTest, UnknownKeysDoNotFailLoad) {
    std::string config_content = R"(
mystery: 1
providers:
  container:
    gpu: true
  cloud:
    endpoint: http://localhost:7000
    region: eu
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_TRUE(load(config_content, config, error)) << "Error: " << error;
}

TEST_F(ConfigTest, WrongValueTypeFails) {
    std::string config_content = R"(
http:
  port: not-a-number
providers:
  container: {}
)";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, InvalidYamlSyntax) {
    std::string config_content = "providers: [unclosed\n";

    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load(config_content, config, error));
    EXPECT_NE(error.find("YAML"), std::string::npos) << error;
}

TEST_F(ConfigTest, FileNotFound) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config("/nonexistent/path/config.yaml", config, error));
    EXPECT_FALSE(error.empty());
}
