#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <memory>
#include <thread>
#include <atomic>
#include <string>
#include <httplib.h>
#include "runtime/config.hpp"

// Forward declarations
namespace coderun {
namespace execution { class ExecutionSupervisor; }
namespace health { class HealthRegistry; }
namespace provider { class ProviderRegistry; }
namespace router { class LanguageRouter; }
}

namespace coderun {
namespace http {

/**
 * @brief HTTP front-end for the execution service
 *
 * Thin adapter layer: decodes requests, hands them to the
 * ExecutionSupervisor and encodes the result. Holds no state of its own.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool, one task per request
 *
 * Endpoints (v0):
 * - POST /v0/execute           -> handle_post_execute
 * - GET  /v0/providers/health  -> handle_get_providers_health
 * - GET  /v0/languages         -> handle_get_languages
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig& config,
               int default_timeout_seconds,
               execution::ExecutionSupervisor& supervisor,
               provider::ProviderRegistry& provider_registry,
               const router::LanguageRouter& router,
               health::HealthRegistry& health);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     * Port 0 binds an ephemeral port (see get_port()).
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string& error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int default_timeout_seconds_;
    int port_ = 0;

    execution::ExecutionSupervisor& supervisor_;
    provider::ProviderRegistry& provider_registry_;
    const router::LanguageRouter& router_;
    health::HealthRegistry& health_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/)
    void handle_post_execute(const httplib::Request& req, httplib::Response& res);
    void handle_get_providers_health(const httplib::Request& req, httplib::Response& res);
    void handle_get_languages(const httplib::Request& req, httplib::Response& res);
};

} // namespace http
} // namespace coderun
