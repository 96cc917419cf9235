#include "json.hpp"

#include <chrono>

namespace coderun {
namespace http {

namespace {

nlohmann::json optional_string(const std::string &value) {
    return value.empty() ? nlohmann::json(nullptr) : nlohmann::json(value);
}

}  // namespace

nlohmann::json encode_attempt(const execution::AttemptRecord &attempt) {
    return {{"provider", attempt.provider},
            {"outcome", execution::outcome_to_string(attempt.outcome)},
            {"durationMs", attempt.duration_ms},
            {"errorMessage", optional_string(attempt.error_message)}};
}

nlohmann::json encode_result(const execution::ExecutionResult &result) {
    nlohmann::json attempts = nlohmann::json::array();
    for (const auto &attempt : result.attempts) {
        attempts.push_back(encode_attempt(attempt));
    }

    return {{"requestId", result.request_id},
            {"language", result.language},
            {"providerUsed", optional_string(result.provider_used)},
            {"stdout", result.stdout_data},
            {"stderr", result.stderr_data},
            {"truncated", result.truncated},
            {"exitCode", result.exit_code ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr)},
            {"durationMs", result.duration_ms},
            {"outcome", execution::outcome_to_string(result.outcome)},
            {"errorCode", execution::error_code_to_string(result.error_code)},
            {"errorMessage", optional_string(result.error_message)},
            {"attempts", attempts}};
}

nlohmann::json encode_descriptor(const execution::ProviderDescriptor &descriptor) {
    return {{"name", descriptor.name},
            {"kind", execution::provider_kind_to_string(descriptor.kind)},
            {"priority", descriptor.priority},
            {"languages", descriptor.supported_languages}};
}

nlohmann::json encode_health_record(const std::optional<health::HealthRecord> &record) {
    if (!record) {
        return {{"checked", false}};
    }

    auto checked_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          record->last_checked_at.time_since_epoch())
                          .count();
    return {{"checked", true},
            {"available", record->is_available},
            {"lastCheckedAtMs", checked_ms},
            {"lastLatencyMs", record->last_latency_ms},
            {"consecutiveFailures", record->consecutive_failures}};
}

bool decode_execute_request(const nlohmann::json &json, int default_timeout_seconds,
                            execution::ExecutionRequest &request, std::string &error) {
    try {
        if (!json.is_object()) {
            error = "Request body must be a JSON object";
            return false;
        }

        if (!json.contains("language") || !json.at("language").is_string()) {
            error = "Missing or non-string 'language'";
            return false;
        }
        request.language = json.at("language").get<std::string>();

        const char *source_key = json.contains("code") ? "code" : "source";
        if (!json.contains(source_key) || !json.at(source_key).is_string()) {
            error = "Missing or non-string 'code'";
            return false;
        }
        request.source = json.at(source_key).get<std::string>();

        // Optional fields
        if (json.contains("stdin") && !json.at("stdin").is_null()) {
            if (!json.at("stdin").is_string()) {
                error = "'stdin' must be a string";
                return false;
            }
            request.stdin_data = json.at("stdin").get<std::string>();
        }

        request.timeout_seconds = default_timeout_seconds;
        if (json.contains("timeout") && !json.at("timeout").is_null()) {
            if (!json.at("timeout").is_number()) {
                error = "'timeout' must be a number of seconds";
                return false;
            }
            // Clamped by the Supervisor; only guard the int conversion here
            double seconds = json.at("timeout").get<double>();
            if (seconds < 0) {
                seconds = 0;
            } else if (seconds > 3600) {
                seconds = 3600;
            }
            request.timeout_seconds = static_cast<int>(seconds);
        }

        if (json.contains("requestId") && !json.at("requestId").is_null()) {
            if (!json.at("requestId").is_string()) {
                error = "'requestId' must be a string";
                return false;
            }
            request.request_id = json.at("requestId").get<std::string>();
        }

        if (json.contains("env") && !json.at("env").is_null()) {
            const auto &env_json = json.at("env");
            if (!env_json.is_object()) {
                error = "'env' must be an object";
                return false;
            }
            for (const auto &[key, val] : env_json.items()) {
                if (!val.is_string()) {
                    error = "Value for env '" + key + "' must be a string";
                    return false;
                }
                request.env[key] = val.get<std::string>();
            }
        }

        if (json.contains("preferredProvider") && !json.at("preferredProvider").is_null()) {
            if (!json.at("preferredProvider").is_string()) {
                error = "'preferredProvider' must be a string";
                return false;
            }
            request.preferred_provider = json.at("preferredProvider").get<std::string>();
        }

        return true;
    } catch (const std::exception &e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

}  // namespace http
}  // namespace coderun
