#include "execution_supervisor.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "health/health_registry.hpp"
#include "logging/logger.hpp"
#include "provider/provider_registry.hpp"
#include "router/language_router.hpp"

namespace coderun {
namespace execution {

namespace {

int64_t elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

struct InFlightGuard {
    explicit InFlightGuard(std::atomic<size_t> &counter) : counter_(counter) { counter_.fetch_add(1); }
    ~InFlightGuard() { counter_.fetch_sub(1); }
    std::atomic<size_t> &counter_;
};

}  // namespace

ExecutionSupervisor::ExecutionSupervisor(provider::ProviderRegistry &providers, const router::LanguageRouter &router,
                                         health::HealthRegistry &health, Options options)
    : providers_(providers), router_(router), health_(health), options_(options) {}

ExecutionResult ExecutionSupervisor::execute(const ExecutionRequest &request) {
    return execute(request, CancellationToken());
}

void ExecutionSupervisor::cancel_all() {
    LOG_INFO("[Supervisor] Cancelling " << in_flight_.load() << " in-flight request(s)");
    shutdown_token_.cancel();
}

bool ExecutionSupervisor::normalize_request(ExecutionRequest &request, std::string &error) const {
    if (request.request_id.empty()) {
        request.request_id = generate_request_id();
    }

    int clamped = clamp_timeout_seconds(request.timeout_seconds);
    if (clamped != request.timeout_seconds) {
        LOG_DEBUG("[Supervisor] " << request.request_id << " timeout " << request.timeout_seconds
                                  << "s clamped to " << clamped << "s");
        request.timeout_seconds = clamped;
    }

    if (request.source.empty()) {
        error = "Source code is empty";
        return false;
    }

    for (const auto &[name, value] : request.env) {
        (void)value;
        if (!is_valid_env_name(name)) {
            error = "Invalid environment variable name: '" + name + "'";
            return false;
        }
    }

    return true;
}

ExecutionResult ExecutionSupervisor::execute(const ExecutionRequest &incoming, CancellationToken token) {
    InFlightGuard guard(in_flight_);

    ExecutionRequest request = incoming;
    std::string error;

    // Received
    if (!normalize_request(request, error)) {
        LOG_WARN("[Supervisor] " << request.request_id << " rejected: " << error);
        return make_failure_result(request, Outcome::InternalError, ErrorCode::INVALID_REQUEST, error);
    }

    // Routing
    router::Resolution resolution;
    if (!router_.resolve(request.language, resolution, error)) {
        LOG_WARN("[Supervisor] " << request.request_id << " " << error);
        return make_failure_result(request, Outcome::InternalError, ErrorCode::UNSUPPORTED_LANGUAGE, error);
    }
    request.language = resolution.canonical_language;

    auto candidates = std::move(resolution.candidates);
    if (request.preferred_provider) {
        auto it = std::find_if(candidates.begin(), candidates.end(), [&request](const ProviderDescriptor &d) {
            return d.name == *request.preferred_provider;
        });
        if (it != candidates.end()) {
            std::rotate(candidates.begin(), it, it + 1);
        } else {
            LOG_WARN("[Supervisor] " << request.request_id << " preferred provider '" << *request.preferred_provider
                                     << "' cannot run " << request.language << ", ignoring");
        }
    }
    auto ranked = health_.rank(candidates);

    // One deadline for the whole request; fallback never extends it
    ExecutionContext ctx{Deadline::after(std::chrono::seconds(request.timeout_seconds)), token};
    CancelRegistration on_shutdown(shutdown_token_, [token]() mutable { token.cancel(); });

    LOG_DEBUG("[Supervisor] " << request.request_id << " language=" << request.language << " timeout="
                              << request.timeout_seconds << "s candidates=" << ranked.size());

    std::vector<AttemptRecord> attempts;
    std::string unavailable_summary;

    for (size_t i = 0; i < ranked.size(); ++i) {
        const auto &name = ranked[i].name;

        // Dispatching
        auto adapter = providers_.get_provider(name);
        auto attempt_started = Clock::now();
        int64_t run_ms = 0;
        ExecutionResult result;
        if (!adapter) {
            result = make_failure_result(request, Outcome::ProviderUnavailable, ErrorCode::PROVIDER_UNAVAILABLE,
                                         "Provider is no longer registered");
        } else {
            // Running
            auto run_started = Clock::now();
            result = attempt(*adapter, name, ctx, request);
            run_ms = elapsed_ms(run_started);
        }
        enforce_invariants(result, name);

        AttemptRecord record;
        record.provider = name;
        record.outcome = result.outcome;
        record.duration_ms = elapsed_ms(attempt_started);
        record.error_message = result.error_message;
        attempts.push_back(record);

        if (result.outcome == Outcome::ProviderUnavailable) {
            health_.record_unavailable(name, result.error_message);
            if (!unavailable_summary.empty()) {
                unavailable_summary += "; ";
            }
            unavailable_summary += name + ": " + result.error_message;

            if (ctx.should_stop()) {
                LOG_WARN("[Supervisor] " << request.request_id << " budget spent after '" << name
                                         << "' was unavailable, not falling back");
                break;
            }
            if (i + 1 < ranked.size()) {
                LOG_INFO("[Supervisor] " << request.request_id << " falling back from '" << name << "' to '"
                                         << ranked[i + 1].name << "' (" << ctx.deadline.remaining().count()
                                         << "ms left)");
            }
            continue;
        }

        // Final: the code ran (or the adapter failed) somewhere, never try another provider
        if (result.error_code != ErrorCode::ADAPTER_FAULT) {
            health_.record_success(name, record.duration_ms);
        }

        result.request_id = request.request_id;
        result.language = request.language;
        result.provider_used = name;
        result.attempts = std::move(attempts);
        if (result.duration_ms <= 0) {
            result.duration_ms = run_ms;
        }

        if (result.outcome == Outcome::InternalError) {
            LOG_ERROR("[Supervisor] " << request.request_id << " provider '" << name
                                      << "' internal error: " << result.error_message);
        } else {
            LOG_INFO("[Supervisor] " << request.request_id << " " << outcome_to_string(result.outcome) << " on '"
                                     << name << "' in " << result.duration_ms << "ms"
                                     << (result.exit_code ? " exit=" + std::to_string(*result.exit_code) : ""));
        }
        return result;
    }

    auto exhausted = make_failure_result(request, Outcome::AllProvidersExhausted, ErrorCode::PROVIDER_UNAVAILABLE,
                                         "All providers unavailable: " + unavailable_summary);
    exhausted.attempts = std::move(attempts);
    LOG_WARN("[Supervisor] " << request.request_id << " " << exhausted.error_message);
    return exhausted;
}

ExecutionResult ExecutionSupervisor::attempt(provider::IProviderAdapter &adapter, const std::string &provider_name,
                                             const ExecutionContext &ctx, const ExecutionRequest &request) {
    try {
        return adapter.execute(ctx, request);
    } catch (const std::exception &e) {
        LOG_ERROR("[Supervisor] " << request.request_id << " provider '" << provider_name
                                  << "' threw: " << e.what());
        return make_failure_result(request, Outcome::InternalError, ErrorCode::ADAPTER_FAULT,
                                   std::string("Provider '") + provider_name + "' failed: " + e.what());
    } catch (...) {
        LOG_ERROR("[Supervisor] " << request.request_id << " provider '" << provider_name
                                  << "' threw unknown exception");
        return make_failure_result(request, Outcome::InternalError, ErrorCode::ADAPTER_FAULT,
                                   "Provider '" + provider_name + "' failed with unknown exception");
    }
}

void ExecutionSupervisor::enforce_invariants(ExecutionResult &result, const std::string &provider_name) const {
    switch (result.outcome) {
        case Outcome::Completed:
            if (!result.exit_code) {
                LOG_ERROR("[Supervisor] " << result.request_id << " provider '" << provider_name
                                          << "' reported Completed without exit code");
                result.outcome = Outcome::InternalError;
                result.error_code = ErrorCode::ADAPTER_FAULT;
                result.error_message = "Provider reported completion without an exit code";
            }
            break;
        case Outcome::ProviderUnavailable:
            result.error_code = ErrorCode::PROVIDER_UNAVAILABLE;
            if (result.error_message.empty()) {
                result.error_message = "Provider unavailable";
            }
            break;
        case Outcome::AllProvidersExhausted:
            // Reserved for the Supervisor itself
            result.outcome = Outcome::InternalError;
            result.error_code = ErrorCode::ADAPTER_FAULT;
            result.error_message = "Provider returned an invalid outcome";
            break;
        case Outcome::TimedOut:
        case Outcome::InternalError:
            break;
    }

    if (result.outcome != Outcome::Completed) {
        result.exit_code.reset();
    }
    if (result.outcome == Outcome::ProviderUnavailable) {
        result.stdout_data.clear();
        result.stderr_data.clear();
        result.truncated = false;
    }

    bool cut_out = truncate_output(result.stdout_data, options_.max_output_bytes);
    bool cut_err = truncate_output(result.stderr_data, options_.max_output_bytes);
    result.truncated = result.truncated || cut_out || cut_err;
}

}  // namespace execution
}  // namespace coderun
