#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace coderun {
namespace execution {

bool ProviderDescriptor::supports(const std::string &canonical_language) const {
    return std::find(supported_languages.begin(), supported_languages.end(), canonical_language) !=
           supported_languages.end();
}

int clamp_timeout_seconds(int requested) { return std::clamp(requested, kMinTimeoutSeconds, kMaxTimeoutSeconds); }

bool truncate_output(std::string &data, size_t max_bytes) {
    if (data.size() <= max_bytes) {
        return false;
    }
    data.resize(max_bytes);
    return true;
}

std::string generate_request_id() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t value = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        value = rng();
    }

    std::ostringstream oss;
    oss << "req-" << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

bool is_valid_env_name(const std::string &name) {
    if (name.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '_';
    });
}

ExecutionResult make_failure_result(const ExecutionRequest &request, Outcome outcome, ErrorCode code,
                                    const std::string &message) {
    ExecutionResult result;
    result.request_id = request.request_id;
    result.language = request.language;
    result.outcome = outcome;
    result.error_code = code;
    result.error_message = message;
    return result;
}

const char *outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed:
            return "Completed";
        case Outcome::TimedOut:
            return "TimedOut";
        case Outcome::ProviderUnavailable:
            return "ProviderUnavailable";
        case Outcome::AllProvidersExhausted:
            return "AllProvidersExhausted";
        case Outcome::InternalError:
            return "InternalError";
    }
    return "InternalError";
}

const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNSUPPORTED_LANGUAGE:
            return "UNSUPPORTED_LANGUAGE";
        case ErrorCode::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case ErrorCode::PROVIDER_UNAVAILABLE:
            return "PROVIDER_UNAVAILABLE";
        case ErrorCode::ADAPTER_FAULT:
            return "ADAPTER_FAULT";
    }
    return "ADAPTER_FAULT";
}

const char *provider_kind_to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Cloud:
            return "cloud";
        case ProviderKind::Container:
            return "container";
    }
    return "unknown";
}

}  // namespace execution
}  // namespace coderun
