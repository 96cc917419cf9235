#pragma once

#include "execution/context.hpp"
#include "execution/types.hpp"

namespace coderun {
namespace provider {

// Uniform contract every isolation backend implements. Also the seam for mocking.
class IProviderAdapter {
public:
    virtual ~IProviderAdapter() = default;

    // Static description, no I/O
    virtual execution::ProviderDescriptor capabilities() const = 0;

    // Lightweight liveness probe. Must return by ctx.deadline; a probe that
    // cannot complete in time reports available=false.
    virtual execution::HealthProbeResult health_check(const execution::ExecutionContext &ctx) = 0;

    // Run caller code. On cancellation or deadline the adapter kills the
    // underlying process/container/remote call and returns TimedOut with the
    // output captured so far. Infrastructure failures are reported as
    // ProviderUnavailable; code that ran and failed is Completed with its exit code.
    virtual execution::ExecutionResult execute(const execution::ExecutionContext &ctx,
                                               const execution::ExecutionRequest &request) = 0;
};

}  // namespace provider
}  // namespace coderun
