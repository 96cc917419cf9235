#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "i_provider_adapter.hpp"
#include "provider_config.hpp"

namespace coderun {
namespace provider {

/**
 * @brief Adapter that runs each request in a disposable, resource-capped container
 *
 * Driven through the Docker CLI. Per request:
 * 1. Write the source into a private work directory (mounted read-only)
 * 2. `docker create -i` a uniquely named container with memory/cpu/pids
 *    limits, no network unless the operator allowed it, read-only rootfs,
 *    all capabilities dropped, and an in-unit `timeout -s KILL`.
 *    A failure here never ran any code and is ProviderUnavailable.
 * 3. `docker start -ai`: stream stdin in, capture stdout/stderr up to the cap,
 *    kill the CLI on deadline or cancellation. Its exit status is the program's.
 * 4. Always `docker rm -f` the container and delete the work directory
 */
class ContainerRuntimeProvider : public IProviderAdapter {
public:
    explicit ContainerRuntimeProvider(ContainerProviderConfig config);

    execution::ProviderDescriptor capabilities() const override;
    execution::HealthProbeResult health_check(const execution::ExecutionContext &ctx) override;
    execution::ExecutionResult execute(const execution::ExecutionContext &ctx,
                                       const execution::ExecutionRequest &request) override;

    const ContainerProviderConfig &config() const { return config_; }

    // Arguments after the docker binary for `docker create`
    std::vector<std::string> build_create_args(const std::string &container_name, const std::string &work_dir,
                                            const ImageSpec &image, const execution::ExecutionRequest &request,
                                            int timeout_seconds) const;

    // Replaces every "{file}" with the in-unit path of the source file
    static std::string expand_command(const std::string &command, const std::string &filename);

    // "coderun-<sanitized request id>-<seq>"
    std::string make_container_name(const std::string &request_id);

private:
    bool prepare_work_dir(const ImageSpec &image, const execution::ExecutionRequest &request, std::string &work_dir,
                          std::string &error) const;
    void remove_container(const std::string &container_name, const std::string &request_id) const;
    // Reads .State.StartedAt. Returns false when the CLI could not answer.
    bool inspect_started(const std::string &container_name, const std::string &request_id, bool &started) const;
    void remove_work_dir(const std::string &work_dir, const std::string &request_id) const;

    ContainerProviderConfig config_;
    std::atomic<uint64_t> sequence_{0};
};

}  // namespace provider
}  // namespace coderun
