#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "execution/types.hpp"
#include "provider/i_provider_adapter.hpp"

namespace coderun::tests {

using namespace coderun;
using namespace testing;

class MockProviderAdapter : public provider::IProviderAdapter {
public:
    MockProviderAdapter(std::string name, std::vector<std::string> languages, int priority = 100,
                        execution::ProviderKind kind = execution::ProviderKind::Cloud) {
        descriptor_.name = std::move(name);
        descriptor_.supported_languages = std::move(languages);
        descriptor_.priority = priority;
        descriptor_.kind = kind;
        ON_CALL(*this, capabilities()).WillByDefault(Return(descriptor_));
    }

    MOCK_METHOD(execution::ProviderDescriptor, capabilities, (), (const, override));
    MOCK_METHOD(execution::HealthProbeResult, health_check, (const execution::ExecutionContext &), (override));
    MOCK_METHOD(execution::ExecutionResult, execute,
                (const execution::ExecutionContext &, const execution::ExecutionRequest &), (override));

    const execution::ProviderDescriptor &descriptor() const { return descriptor_; }

private:
    execution::ProviderDescriptor descriptor_;
};

// Result helpers for stubbing execute()
inline execution::ExecutionResult completed(int exit_code, const std::string &out = "", const std::string &err = "") {
    execution::ExecutionResult result;
    result.outcome = execution::Outcome::Completed;
    result.exit_code = exit_code;
    result.stdout_data = out;
    result.stderr_data = err;
    result.duration_ms = 5;
    return result;
}

inline execution::ExecutionResult unavailable(const std::string &message) {
    execution::ExecutionResult result;
    result.outcome = execution::Outcome::ProviderUnavailable;
    result.error_message = message;
    return result;
}

inline execution::ExecutionResult timed_out(const std::string &out = "") {
    execution::ExecutionResult result;
    result.outcome = execution::Outcome::TimedOut;
    result.stdout_data = out;
    result.error_message = "Execution exceeded its time budget";
    return result;
}

}  // namespace coderun::tests
