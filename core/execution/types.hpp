#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coderun {
namespace execution {

constexpr int kMinTimeoutSeconds = 1;
constexpr int kMaxTimeoutSeconds = 60;
constexpr int kDefaultTimeoutSeconds = 30;

// Per-stream capture cap (1 MiB)
constexpr size_t kDefaultMaxOutputBytes = 1024u * 1024u;

// Terminal classification of an execution
enum class Outcome { Completed, TimedOut, ProviderUnavailable, AllProvidersExhausted, InternalError };

enum class ErrorCode { NONE, UNSUPPORTED_LANGUAGE, INVALID_REQUEST, PROVIDER_UNAVAILABLE, ADAPTER_FAULT };

// Closed set of isolation backends
enum class ProviderKind { Cloud, Container };

struct ExecutionRequest {
    std::string request_id;
    std::string language;  // raw, resolved through the LanguageRouter
    std::string source;
    std::optional<std::string> stdin_data;
    int timeout_seconds = kDefaultTimeoutSeconds;  // clamped to [1, 60] before use
    std::map<std::string, std::string> env;
    std::optional<std::string> preferred_provider;
};

struct AttemptRecord {
    std::string provider;
    Outcome outcome = Outcome::InternalError;
    int64_t duration_ms = 0;
    std::string error_message;
};

struct ExecutionResult {
    std::string request_id;
    std::string language;
    std::string provider_used;  // empty when no provider produced the result

    std::string stdout_data;
    std::string stderr_data;
    bool truncated = false;

    std::optional<int> exit_code;  // present iff outcome == Completed
    int64_t duration_ms = 0;       // execution wall time, excludes selection/dispatch
    Outcome outcome = Outcome::InternalError;

    ErrorCode error_code = ErrorCode::NONE;
    std::string error_message;
    std::vector<AttemptRecord> attempts;
};

struct ProviderDescriptor {
    std::string name;
    ProviderKind kind = ProviderKind::Cloud;
    std::vector<std::string> supported_languages;  // canonical identifiers
    int priority = 100;                            // lower is preferred

    bool supports(const std::string &canonical_language) const;
};

struct HealthProbeResult {
    bool available = false;
    int64_t latency_ms = 0;
    std::string detail;
};

int clamp_timeout_seconds(int requested);

// Trim data to max_bytes. Returns true if anything was cut.
bool truncate_output(std::string &data, size_t max_bytes);

// "req-" + 16 hex digits
std::string generate_request_id();

// Environment variable names accepted for injection into an execution
bool is_valid_env_name(const std::string &name);

// Result skeleton carrying the request's identity and a failure classification
ExecutionResult make_failure_result(const ExecutionRequest &request, Outcome outcome, ErrorCode code,
                                    const std::string &message);

const char *outcome_to_string(Outcome outcome);
const char *error_code_to_string(ErrorCode code);
const char *provider_kind_to_string(ProviderKind kind);

}  // namespace execution
}  // namespace coderun
