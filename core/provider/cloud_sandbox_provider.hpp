#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "i_provider_adapter.hpp"
#include "provider_config.hpp"

namespace coderun {
namespace provider {

/**
 * @brief Adapter for a remote, managed sandbox-execution API
 *
 * Stateless per call: every execute() is one POST to the remote endpoint.
 * The transport read timeout is the execution budget plus a network margin so
 * the sandbox's own timeout fires first for legitimate runs.
 *
 * Failure mapping:
 * - connect/DNS/TLS failure, non-2xx status -> ProviderUnavailable, even when
 *   the budget ran out while connecting
 * - read/write failure after deadline or cancellation -> TimedOut
 * - 2xx with an unusable body -> InternalError
 */
class CloudSandboxProvider : public IProviderAdapter {
public:
    explicit CloudSandboxProvider(CloudProviderConfig config);

    execution::ProviderDescriptor capabilities() const override;
    execution::HealthProbeResult health_check(const execution::ExecutionContext &ctx) override;
    execution::ExecutionResult execute(const execution::ExecutionContext &ctx,
                                       const execution::ExecutionRequest &request) override;

    const CloudProviderConfig &config() const { return config_; }

    // Wire encoding, exposed for tests
    static nlohmann::json build_request_body(const execution::ExecutionRequest &request, int timeout_seconds);

    // Map a 2xx response body onto result. Returns false when the body is unusable.
    static bool decode_response_body(const std::string &body, size_t max_output_bytes,
                                     execution::ExecutionResult &result, std::string &error);

private:
    CloudProviderConfig config_;
};

}  // namespace provider
}  // namespace coderun
