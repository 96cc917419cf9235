#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "provider/cloud_sandbox_provider.hpp"
#include "provider/container_runtime_provider.hpp"
#include "signal_handler.hpp"

namespace coderun {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing coderun");

    if (!init_providers(error)) {
        return false;
    }

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_health(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_providers(std::string &error) {
    const auto &cloud = config_.providers.cloud;
    if (cloud.enabled) {
        LOG_INFO("[Runtime] Creating cloud provider: " << cloud.endpoint);
        if (cloud.api_key.empty()) {
            LOG_WARN("[Runtime] Cloud provider has no API key (set providers.cloud.api_key or " << kCloudApiKeyEnv
                                                                                              << ")");
        }
        if (!provider_registry_.add_provider(std::make_shared<provider::CloudSandboxProvider>(cloud))) {
            error = "Failed to register cloud provider";
            return false;
        }
    }

    const auto &container = config_.providers.container;
    if (container.enabled) {
        LOG_INFO("[Runtime] Creating container provider via '" << container.docker_binary << "'");
        if (container.allow_network) {
            LOG_WARN("[Runtime] Container provider allows network access from executed code");
        }
        if (!provider_registry_.add_provider(std::make_shared<provider::ContainerRuntimeProvider>(container))) {
            error = "Failed to register container provider";
            return false;
        }
    }

    if (provider_registry_.provider_count() == 0) {
        error = "No providers enabled";
        return false;
    }

    LOG_INFO("[Runtime] " << provider_registry_.provider_count() << " provider(s) registered");
    return true;
}

bool Runtime::init_core_services(std::string &) {
    health_ = std::make_unique<health::HealthRegistry>(config_.health.failure_threshold);
    for (const auto &name : provider_registry_.get_provider_names()) {
        health_->register_provider(name);
    }

    // Router is immutable: built once all providers are registered
    router_ = std::make_unique<router::LanguageRouter>(provider_registry_.descriptors(), config_.languages.aliases);
    LOG_INFO("[Runtime] Languages: " << router_->supported_languages().size() << " canonical, "
                                     << router_->aliases().size() << " aliases");

    execution::ExecutionSupervisor::Options options;
    options.max_output_bytes = config_.service.max_output_bytes;
    supervisor_ = std::make_unique<execution::ExecutionSupervisor>(provider_registry_, *router_, *health_, options);
    LOG_INFO("[Runtime] Execution supervisor created");

    return true;
}

bool Runtime::init_health(std::string &) {
    prober_ = std::make_unique<health::HealthProber>(provider_registry_, *health_,
                                                     std::chrono::milliseconds(config_.health.probe_interval_ms),
                                                     std::chrono::milliseconds(config_.health.probe_timeout_ms));

    // Prime records so the first requests already see known-down providers
    prober_->probe_all_once();
    for (const auto &[name, record] : health_->snapshot_all()) {
        LOG_INFO("[Runtime] Provider '" << name << "' " << (record.is_available ? "available" : "unavailable")
                                        << " (" << record.last_latency_ms << "ms)");
    }
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.service.default_timeout_seconds,
                                                      *supervisor_, provider_registry_, *router_, *health_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    if (!prober_->start()) {
        LOG_WARN("[Runtime] Health prober failed to start");
    }

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Cancel first: stopping the server waits for its workers, and any
    // request admitted after this is cancelled on arrival
    if (supervisor_) {
        supervisor_->cancel_all();
    }

    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (prober_) {
        LOG_INFO("[Runtime] Stopping health prober");
        prober_->stop();
    }

    // Adapters are released with the registry
    provider_registry_.clear();
}

}  // namespace runtime
}  // namespace coderun
