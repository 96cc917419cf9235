#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "execution/types.hpp"
#include "health/health_registry.hpp"

namespace coderun {
namespace http {

/**
 * @brief JSON encoding utilities for execution types
 *
 * Field names are camelCase on the wire. Absent optionals encode as null.
 */

nlohmann::json encode_result(const execution::ExecutionResult& result);
nlohmann::json encode_attempt(const execution::AttemptRecord& attempt);
nlohmann::json encode_descriptor(const execution::ProviderDescriptor& descriptor);
nlohmann::json encode_health_record(const std::optional<health::HealthRecord>& record);

// Decode POST /v0/execute body. "code" and "source" are accepted for the program text.
bool decode_execute_request(const nlohmann::json& json,
                            int default_timeout_seconds,
                            execution::ExecutionRequest& request,
                            std::string& error);

} // namespace http
} // namespace coderun
