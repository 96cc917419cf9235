#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "execution/types.hpp"
#include "health_registry.hpp"
#include "provider/provider_registry.hpp"

namespace coderun {
namespace health {

/**
 * @brief Periodic provider liveness prober
 *
 * Runs health_check() against every registered adapter on a background
 * thread and records the result in the HealthRegistry. The wait between
 * rounds is interruptible so stop() returns promptly.
 *
 * Probes run one provider at a time with no registry lock held.
 */
class HealthProber {
public:
    HealthProber(provider::ProviderRegistry &providers, HealthRegistry &health, std::chrono::milliseconds interval,
                 std::chrono::milliseconds probe_timeout);

    ~HealthProber() { stop(); }

    HealthProber(const HealthProber &) = delete;
    HealthProber &operator=(const HealthProber &) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // One synchronous round over all providers. Used to prime records at start-up.
    void probe_all_once();

    // Probe a single adapter and record the result
    execution::HealthProbeResult probe(const std::string &provider_name, provider::IProviderAdapter &adapter);

    size_t rounds_completed() const { return rounds_.load(); }

private:
    void probe_loop();

    provider::ProviderRegistry &providers_;
    HealthRegistry &health_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds probe_timeout_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> rounds_{0};
    std::thread probe_thread_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stop_requested_ = false;
};

}  // namespace health
}  // namespace coderun
