#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "../execution/types.hpp"
#include "../logging/logger.hpp"
#include "../router/language_router.hpp"

namespace coderun {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        auto key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown key: '" << section << key << "' (will be ignored)");
        }
    }
}

std::vector<std::string> load_string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

void load_cloud(const YAML::Node &node, provider::CloudProviderConfig &cloud) {
    warn_unknown_keys(node, "providers.cloud.",
                      {"enabled", "priority", "endpoint", "api_key", "execute_path", "health_path",
                       "network_margin_seconds", "languages"});

    if (node["enabled"]) {
        cloud.enabled = node["enabled"].as<bool>();
    }
    if (node["priority"]) {
        cloud.priority = node["priority"].as<int>();
    }
    if (node["endpoint"]) {
        cloud.endpoint = node["endpoint"].as<std::string>();
    }
    if (node["api_key"]) {
        cloud.api_key = node["api_key"].as<std::string>();
    }
    if (node["execute_path"]) {
        cloud.execute_path = node["execute_path"].as<std::string>();
    }
    if (node["health_path"]) {
        cloud.health_path = node["health_path"].as<std::string>();
    }
    if (node["network_margin_seconds"]) {
        cloud.network_margin_seconds = node["network_margin_seconds"].as<int>();
    }
    if (node["languages"]) {
        cloud.languages.clear();
        for (const auto &language : load_string_list(node["languages"])) {
            cloud.languages.push_back(router::LanguageRouter::normalize(language));
        }
    }
}

void load_container(const YAML::Node &node, provider::ContainerProviderConfig &container) {
    warn_unknown_keys(node, "providers.container.",
                      {"enabled", "priority", "docker_binary", "work_root", "memory_mb", "cpus", "pids_limit",
                       "tmpfs_mb", "allow_network", "images"});

    if (node["enabled"]) {
        container.enabled = node["enabled"].as<bool>();
    }
    if (node["priority"]) {
        container.priority = node["priority"].as<int>();
    }
    if (node["docker_binary"]) {
        container.docker_binary = node["docker_binary"].as<std::string>();
    }
    if (node["work_root"]) {
        container.work_root = node["work_root"].as<std::string>();
    }
    if (node["memory_mb"]) {
        container.memory_mb = node["memory_mb"].as<int>();
    }
    if (node["cpus"]) {
        container.cpus = node["cpus"].as<double>();
    }
    if (node["pids_limit"]) {
        container.pids_limit = node["pids_limit"].as<int>();
    }
    if (node["tmpfs_mb"]) {
        container.tmpfs_mb = node["tmpfs_mb"].as<int>();
    }
    if (node["allow_network"]) {
        container.allow_network = node["allow_network"].as<bool>();
    }

    if (node["images"]) {
        container.images.clear();  // Ensure idempotent parsing
        for (const auto &image_node : node["images"]) {
            provider::ImageSpec spec;
            const auto &fields = image_node.second;
            if (fields["image"]) {
                spec.image = fields["image"].as<std::string>();
            }
            if (fields["command"]) {
                spec.command = fields["command"].as<std::string>();
            }
            if (fields["filename"]) {
                spec.filename = fields["filename"].as<std::string>();
            }
            // Keyed the way the router spells languages
            container.images[router::LanguageRouter::normalize(image_node.first.as<std::string>())] = spec;
        }
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate service settings
    if (config.service.default_timeout_seconds < execution::kMinTimeoutSeconds ||
        config.service.default_timeout_seconds > execution::kMaxTimeoutSeconds) {
        error = "service.default_timeout_seconds must be between " + std::to_string(execution::kMinTimeoutSeconds) +
                " and " + std::to_string(execution::kMaxTimeoutSeconds);
        return false;
    }
    if (config.service.max_output_bytes < 1024) {
        error = "service.max_output_bytes must be >= 1024";
        return false;
    }
    if (config.service.teardown_timeout_ms < 100) {
        error = "service.teardown_timeout_ms must be >= 100ms";
        return false;
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
    }

    // Validate health settings
    if (config.health.probe_interval_ms < 100) {
        error = "health.probe_interval_ms must be >= 100ms";
        return false;
    }
    if (config.health.probe_timeout_ms < 100 || config.health.probe_timeout_ms > 10000) {
        error = "health.probe_timeout_ms must be between 100 and 10000ms";
        return false;
    }
    if (config.health.failure_threshold < 1) {
        error = "health.failure_threshold must be >= 1";
        return false;
    }

    for (const auto &[alias, canonical] : config.languages.aliases) {
        if (alias.empty() || canonical.empty()) {
            error = "languages.aliases entries must have a non-empty alias and target";
            return false;
        }
    }

    // Validate provider settings
    const auto &cloud = config.providers.cloud;
    const auto &container = config.providers.container;
    if (!cloud.enabled && !container.enabled) {
        error = "Config must enable at least one provider";
        return false;
    }

    if (cloud.enabled) {
        if (cloud.endpoint.empty()) {
            error = "Cloud provider enabled but 'endpoint' not specified";
            return false;
        }
        if (cloud.languages.empty()) {
            error = "Cloud provider must declare at least one language";
            return false;
        }
        for (const auto &language : cloud.languages) {
            if (language.empty()) {
                error = "providers.cloud.languages entries must be non-empty";
                return false;
            }
        }
        if (cloud.network_margin_seconds < 0) {
            error = "providers.cloud.network_margin_seconds must be >= 0";
            return false;
        }
    }

    if (container.enabled) {
        if (container.docker_binary.empty()) {
            error = "Container provider 'docker_binary' must not be empty";
            return false;
        }
        if (container.images.empty()) {
            error = "Container provider must declare at least one image";
            return false;
        }
        for (const auto &[language, spec] : container.images) {
            if (language.empty()) {
                error = "Container image keys must be non-empty language names";
                return false;
            }
            if (spec.image.empty() || spec.command.empty() || spec.filename.empty()) {
                error = "Container image for '" + language + "' needs 'image', 'command' and 'filename'";
                return false;
            }
        }
        if (container.memory_mb < 16) {
            error = "providers.container.memory_mb must be >= 16";
            return false;
        }
        if (container.cpus <= 0.0) {
            error = "providers.container.cpus must be > 0";
            return false;
        }
        if (container.pids_limit < 1) {
            error = "providers.container.pids_limit must be >= 1";
            return false;
        }
        if (container.tmpfs_mb < 1) {
            error = "providers.container.tmpfs_mb must be >= 1";
            return false;
        }
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        warn_unknown_keys(yaml, "", {"service", "http", "health", "languages", "providers", "logging"});

        // Load service config
        if (yaml["service"]) {
            const auto &service = yaml["service"];
            if (service["default_timeout_seconds"]) {
                config.service.default_timeout_seconds = service["default_timeout_seconds"].as<int>();
            }
            if (service["max_output_bytes"]) {
                config.service.max_output_bytes = service["max_output_bytes"].as<size_t>();
            }
            if (service["teardown_timeout_ms"]) {
                config.service.teardown_timeout_ms = service["teardown_timeout_ms"].as<int>();
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["enabled"]) {
                config.http.enabled = yaml["http"]["enabled"].as<bool>();
            }
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load health config
        if (yaml["health"]) {
            if (yaml["health"]["probe_interval_ms"]) {
                config.health.probe_interval_ms = yaml["health"]["probe_interval_ms"].as<int>();
            }
            if (yaml["health"]["probe_timeout_ms"]) {
                config.health.probe_timeout_ms = yaml["health"]["probe_timeout_ms"].as<int>();
            }
            if (yaml["health"]["failure_threshold"]) {
                config.health.failure_threshold = yaml["health"]["failure_threshold"].as<int>();
            }
        }

        // Load language aliases
        if (yaml["languages"] && yaml["languages"]["aliases"]) {
            config.languages.aliases.clear();
            for (const auto &alias : yaml["languages"]["aliases"]) {
                config.languages.aliases[alias.first.as<std::string>()] = alias.second.as<std::string>();
            }
        }

        // Load providers. A provider without a section is off.
        const auto &providers = yaml["providers"];
        if (providers && providers["cloud"]) {
            load_cloud(providers["cloud"], config.providers.cloud);
        } else {
            config.providers.cloud.enabled = false;
        }
        if (providers && providers["container"]) {
            load_container(providers["container"], config.providers.container);
        } else {
            config.providers.container.enabled = false;
        }

        // Check for API key from environment variable if not in config
        if (config.providers.cloud.enabled && config.providers.cloud.api_key.empty()) {
            const char *key_env = std::getenv(kCloudApiKeyEnv);
            if (key_env != nullptr) {
                config.providers.cloud.api_key = key_env;
            }
        }

        // Built-in image table when none configured
        if (config.providers.container.images.empty()) {
            config.providers.container.images = provider::default_container_images();
        }

        // Service-wide limits flow into the adapters
        config.providers.cloud.max_output_bytes = config.service.max_output_bytes;
        config.providers.container.max_output_bytes = config.service.max_output_bytes;
        config.providers.container.teardown_timeout_ms = config.service.teardown_timeout_ms;

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream providers_msg;
        providers_msg << "[Config] Providers:";
        if (config.providers.cloud.enabled) {
            providers_msg << " cloud (" << config.providers.cloud.endpoint << ", priority "
                          << config.providers.cloud.priority << ")";
        }
        if (config.providers.container.enabled) {
            providers_msg << " container (" << config.providers.container.images.size() << " images, priority "
                          << config.providers.container.priority
                          << (config.providers.container.allow_network ? ", network allowed" : "") << ")";
        }
        LOG_INFO(providers_msg.str());

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Health probe every " << config.health.probe_interval_ms << "ms (timeout "
                                                << config.health.probe_timeout_ms << "ms, threshold "
                                                << config.health.failure_threshold << ")");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace coderun
