#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "../provider/provider_config.hpp"

namespace coderun {
namespace runtime {

// service: section
struct ServiceConfig {
    int default_timeout_seconds = 30;         // Used when a request omits its timeout (1-60)
    size_t max_output_bytes = 1024u * 1024u;  // Per-stream capture cap
    int teardown_timeout_ms = 10000;          // Bound on cleanup commands
};

struct HttpConfig {
    bool enabled = true;             // HTTP server enabled
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8090;                 // HTTP port
    int thread_pool_size = 16;       // Worker thread pool size
};

struct HealthConfig {
    int probe_interval_ms = 30000;  // Background probe period (>= 100ms)
    int probe_timeout_ms = 2000;    // Per-probe budget (100-10000ms)
    int failure_threshold = 3;      // Consecutive failures that demote a provider
};

struct LanguagesConfig {
    std::map<std::string, std::string> aliases;  // Extra alias -> canonical identifier
};

struct ProvidersConfig {
    provider::CloudProviderConfig cloud;
    provider::ContainerProviderConfig container;
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    ServiceConfig service;
    HttpConfig http;
    HealthConfig health;
    LanguagesConfig languages;
    ProvidersConfig providers;
    LoggingConfig logging;
};

// Environment variable consulted when providers.cloud.api_key is empty
constexpr const char *kCloudApiKeyEnv = "CODERUN_CLOUD_API_KEY";

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace coderun
