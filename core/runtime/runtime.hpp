#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "execution/execution_supervisor.hpp"
#include "health/health_prober.hpp"
#include "health/health_registry.hpp"
#include "http/server.hpp"
#include "provider/provider_registry.hpp"
#include "router/language_router.hpp"

namespace coderun {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Build providers, router, health tracking, supervisor and HTTP front-end
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop HTTP, cancel in-flight executions, stop the prober
    void shutdown();

    provider::ProviderRegistry &get_provider_registry() { return provider_registry_; }
    health::HealthRegistry &get_health_registry() { return *health_; }
    const router::LanguageRouter &get_router() const { return *router_; }
    execution::ExecutionSupervisor &get_supervisor() { return *supervisor_; }
    http::HttpServer *get_http_server() { return http_server_.get(); }

private:
    // Staged initialization helpers
    bool init_providers(std::string &error);
    bool init_core_services(std::string &error);
    bool init_health(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    provider::ProviderRegistry provider_registry_;
    std::unique_ptr<health::HealthRegistry> health_;
    std::unique_ptr<router::LanguageRouter> router_;
    std::unique_ptr<execution::ExecutionSupervisor> supervisor_;
    std::unique_ptr<health::HealthProber> prober_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace coderun
