#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

#include "context.hpp"
#include "types.hpp"

namespace coderun {
namespace health {
class HealthRegistry;
}
namespace provider {
class IProviderAdapter;
class ProviderRegistry;
}  // namespace provider
namespace router {
class LanguageRouter;
}

namespace execution {

/**
 * @brief Orchestrates one execution request across the candidate providers
 *
 * Per request: validate -> route -> rank by health -> attempt providers in
 * order under one overall deadline. Only ProviderUnavailable moves on to the
 * next candidate, and only while budget remains; any other outcome is final,
 * so user code runs on at most one provider.
 *
 * Thread Safety: execute() may be called concurrently. The only shared
 * mutable state it touches is the HealthRegistry.
 */
class ExecutionSupervisor {
public:
    struct Options {
        size_t max_output_bytes = kDefaultMaxOutputBytes;
    };

    ExecutionSupervisor(provider::ProviderRegistry &providers, const router::LanguageRouter &router,
                        health::HealthRegistry &health, Options options);

    ExecutionSupervisor(const ExecutionSupervisor &) = delete;
    ExecutionSupervisor &operator=(const ExecutionSupervisor &) = delete;

    // Never throws for expected failures; every failure mode is an Outcome
    ExecutionResult execute(const ExecutionRequest &request);

    // Same, with a caller-owned token that cancels the in-flight attempt
    ExecutionResult execute(const ExecutionRequest &request, CancellationToken token);

    // Cancel every in-flight request. Used on shutdown.
    void cancel_all();

    size_t in_flight() const { return in_flight_.load(); }

private:
    // Fills in id, clamps the timeout; returns false with message for rejected requests
    bool normalize_request(ExecutionRequest &request, std::string &error) const;

    // One adapter call with exception containment
    ExecutionResult attempt(provider::IProviderAdapter &adapter, const std::string &provider_name,
                            const ExecutionContext &ctx, const ExecutionRequest &request);

    // Enforce result invariants on whatever an adapter returned
    void enforce_invariants(ExecutionResult &result, const std::string &provider_name) const;

    provider::ProviderRegistry &providers_;
    const router::LanguageRouter &router_;
    health::HealthRegistry &health_;
    Options options_;

    CancellationToken shutdown_token_;
    std::atomic<size_t> in_flight_{0};
};

}  // namespace execution
}  // namespace coderun
