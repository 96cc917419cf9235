#include "server.hpp"

#include "errors.hpp"
#include "logging/logger.hpp"

namespace coderun {
namespace http {

namespace {
// Read timeout covers upload of the request body, not execution
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
// Longest execution plus network margin and teardown
constexpr int kWriteTimeoutSeconds = 90;
constexpr size_t kMaxRequestBytes = 4u * 1024u * 1024u;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, int default_timeout_seconds,
                       execution::ExecutionSupervisor &supervisor, provider::ProviderRegistry &provider_registry,
                       const router::LanguageRouter &router, health::HealthRegistry &health)
    : config_(config),
      default_timeout_seconds_(default_timeout_seconds),
      supervisor_(supervisor),
      provider_registry_(provider_registry),
      router_(router),
      health_(health) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kWriteTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_payload_max_length(kMaxRequestBytes);

    // Each in-flight execution holds one worker for its whole budget
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // Set error handler for JSON error responses (called for HTTP errors like 404)
    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ <= 0) {
            error = "Failed to bind to " + config_.bind + " on an ephemeral port";
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // POST /v0/execute - Run code on the best available provider
    server_->Post("/v0/execute",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_execute(req, res); });

    // GET /v0/providers/health - Provider descriptors with last-known health
    server_->Get("/v0/providers/health", [this](const httplib::Request &req, httplib::Response &res) {
        handle_get_providers_health(req, res);
    });

    // GET /v0/languages - Canonical languages, serving providers and aliases
    server_->Get("/v0/languages",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_languages(req, res); });
}

}  // namespace http
}  // namespace coderun
