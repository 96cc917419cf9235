#include "cloud_sandbox_provider.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

#include "logging/logger.hpp"

namespace coderun {
namespace provider {

namespace {

constexpr std::chrono::milliseconds kMaxConnectTimeout{5000};
constexpr std::chrono::milliseconds kMinTimeout{1};
// A day; nothing the service runs comes close
constexpr int64_t kMaxDurationMs = 24LL * 60 * 60 * 1000;

int64_t elapsed_ms(execution::Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(execution::Clock::now() - since).count();
}

bool is_success(int status) { return status >= 200 && status < 300; }

// Reads a JSON number into [min, max] without an out-of-range conversion
bool read_bounded(const nlohmann::json &value, int64_t min, int64_t max, int64_t &out) {
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(max)) {
            return false;
        }
        out = static_cast<int64_t>(v);
        return true;
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < min || v > max) {
            return false;
        }
        out = v;
        return true;
    }
    if (value.is_number_float()) {
        auto v = value.get<double>();
        if (!std::isfinite(v) || v < static_cast<double>(min) || v > static_cast<double>(max)) {
            return false;
        }
        out = static_cast<int64_t>(v);
        return true;
    }
    return false;
}

// Errors raised once the connection was up and the request was going out.
// Connect, DNS and TLS failures happen before the remote sees any code.
bool request_was_sent(httplib::Error error) {
    switch (error) {
    case httplib::Error::Read:
    case httplib::Error::Write:
    case httplib::Error::Canceled:
        return true;
    default:
        return false;
    }
}

}  // namespace

CloudSandboxProvider::CloudSandboxProvider(CloudProviderConfig config) : config_(std::move(config)) {}

execution::ProviderDescriptor CloudSandboxProvider::capabilities() const {
    execution::ProviderDescriptor descriptor;
    descriptor.name = config_.name;
    descriptor.kind = execution::ProviderKind::Cloud;
    descriptor.supported_languages = config_.languages;
    descriptor.priority = config_.priority;
    return descriptor;
}

nlohmann::json CloudSandboxProvider::build_request_body(const execution::ExecutionRequest &request,
                                                        int timeout_seconds) {
    nlohmann::json body;
    body["requestId"] = request.request_id;
    body["language"] = request.language;
    body["source"] = request.source;
    body["stdin"] = request.stdin_data ? nlohmann::json(*request.stdin_data) : nlohmann::json(nullptr);
    body["timeoutSeconds"] = timeout_seconds;
    body["env"] = nlohmann::json::object();
    for (const auto &[name, value] : request.env) {
        body["env"][name] = value;
    }
    return body;
}

bool CloudSandboxProvider::decode_response_body(const std::string &body, size_t max_output_bytes,
                                                execution::ExecutionResult &result, std::string &error) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        error = "Sandbox response is not a JSON object";
        return false;
    }

    bool has_exit_code = j.contains("exitCode") && j["exitCode"].is_number_integer();
    bool has_timed_out = j.contains("timedOut") && j["timedOut"].is_boolean();
    if (!has_exit_code && !has_timed_out) {
        error = "Sandbox response has neither exitCode nor timedOut";
        return false;
    }

    if (j.contains("stdout") && j["stdout"].is_string()) {
        result.stdout_data = j["stdout"].get<std::string>();
    }
    if (j.contains("stderr") && j["stderr"].is_string()) {
        result.stderr_data = j["stderr"].get<std::string>();
    }
    bool cut_out = execution::truncate_output(result.stdout_data, max_output_bytes);
    bool cut_err = execution::truncate_output(result.stderr_data, max_output_bytes);
    result.truncated = cut_out || cut_err;

    if (j.contains("durationMs") && j["durationMs"].is_number()) {
        if (!read_bounded(j["durationMs"], 0, kMaxDurationMs, result.duration_ms)) {
            error = "Sandbox response has an out-of-range durationMs";
            return false;
        }
    }

    bool timed_out = has_timed_out && j["timedOut"].get<bool>();
    if (timed_out) {
        result.outcome = execution::Outcome::TimedOut;
        result.error_message = "Execution timed out in remote sandbox";
        return true;
    }
    if (!has_exit_code) {
        error = "Sandbox response has no exit code";
        return false;
    }

    int64_t exit_code = 0;
    if (!read_bounded(j["exitCode"], std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), exit_code)) {
        error = "Sandbox response has an out-of-range exitCode";
        return false;
    }
    result.outcome = execution::Outcome::Completed;
    result.exit_code = static_cast<int>(exit_code);
    return true;
}

execution::HealthProbeResult CloudSandboxProvider::health_check(const execution::ExecutionContext &ctx) {
    execution::HealthProbeResult probe;
    auto started = execution::Clock::now();

    httplib::Client client(config_.endpoint);
    auto budget = std::max(ctx.deadline.remaining(), kMinTimeout);
    client.set_connection_timeout(budget);
    client.set_read_timeout(budget);
    client.set_write_timeout(budget);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("X-API-Key", config_.api_key);
    }

    auto res = client.Get(config_.health_path, headers);
    probe.latency_ms = elapsed_ms(started);

    if (!res) {
        probe.available = false;
        probe.detail = "Transport error: " + httplib::to_string(res.error());
        return probe;
    }
    if (!is_success(res->status)) {
        probe.available = false;
        probe.detail = "HTTP " + std::to_string(res->status);
        return probe;
    }

    probe.available = true;
    probe.detail = "ok";
    return probe;
}

execution::ExecutionResult CloudSandboxProvider::execute(const execution::ExecutionContext &ctx,
                                                         const execution::ExecutionRequest &request) {
    execution::ExecutionResult result;
    result.request_id = request.request_id;
    result.language = request.language;
    result.provider_used = config_.name;

    if (ctx.should_stop()) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = "No budget left to dispatch";
        return result;
    }

    // The remote only gets what is left of the request budget
    int timeout_seconds = std::min(request.timeout_seconds, ctx.deadline.remaining_seconds_ceil());
    auto margin = std::chrono::seconds(config_.network_margin_seconds);
    auto remaining = std::max(ctx.deadline.remaining(), kMinTimeout);

    httplib::Client client(config_.endpoint);
    client.set_connection_timeout(std::min(remaining, kMaxConnectTimeout));
    client.set_read_timeout(std::min<std::chrono::milliseconds>(std::chrono::seconds(timeout_seconds) + margin,
                                                                remaining + margin));
    client.set_write_timeout(remaining + margin);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("X-API-Key", config_.api_key);
    }

    auto body = build_request_body(request, timeout_seconds).dump();

    LOG_DEBUG("[Cloud] " << request.request_id << " POST " << config_.endpoint << config_.execute_path << " ("
                         << request.language << ", " << timeout_seconds << "s)");

    // Cancellation shuts the client's socket from the cancelling thread
    execution::CancelRegistration on_cancel(ctx.token, [&client]() { client.stop(); });

    auto started = execution::Clock::now();
    auto res = client.Post(config_.execute_path, headers, body, "application/json");
    auto measured_ms = elapsed_ms(started);

    if (!res) {
        auto transport_error = httplib::to_string(res.error());
        if (ctx.should_stop() && request_was_sent(res.error())) {
            // The code may already be running remotely; never fall back
            result.outcome = execution::Outcome::TimedOut;
            result.error_message = std::string(ctx.cancelled() ? "Cancelled" : "Deadline reached") +
                                   " while waiting for sandbox (" + transport_error + ")";
            result.duration_ms = measured_ms;
            LOG_INFO("[Cloud] " << request.request_id << " " << result.error_message);
            return result;
        }
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = "Transport error: " + transport_error;
        LOG_WARN("[Cloud] " << request.request_id << " " << result.error_message);
        return result;
    }

    if (!is_success(res->status)) {
        result.outcome = execution::Outcome::ProviderUnavailable;
        result.error_message = "Sandbox returned HTTP " + std::to_string(res->status);
        LOG_WARN("[Cloud] " << request.request_id << " " << result.error_message);
        return result;
    }

    std::string error;
    if (!decode_response_body(res->body, config_.max_output_bytes, result, error)) {
        result.outcome = execution::Outcome::InternalError;
        result.error_code = execution::ErrorCode::ADAPTER_FAULT;
        result.error_message = error;
        result.stdout_data.clear();
        result.stderr_data.clear();
        result.truncated = false;
        LOG_ERROR("[Cloud] " << request.request_id << " " << error);
        return result;
    }

    if (result.duration_ms <= 0) {
        result.duration_ms = measured_ms;
    }
    return result;
}

}  // namespace provider
}  // namespace coderun
