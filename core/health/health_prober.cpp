#include "health_prober.hpp"

#include <exception>

#include "execution/context.hpp"
#include "logging/logger.hpp"

namespace coderun {
namespace health {

HealthProber::HealthProber(provider::ProviderRegistry &providers, HealthRegistry &health,
                           std::chrono::milliseconds interval, std::chrono::milliseconds probe_timeout)
    : providers_(providers), health_(health), interval_(interval), probe_timeout_(probe_timeout) {}

bool HealthProber::start() {
    if (running_.load()) {
        LOG_WARN("[Health] Prober already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    probe_thread_ = std::thread(&HealthProber::probe_loop, this);

    LOG_INFO("[Health] Prober started (interval=" << interval_.count() << "ms, timeout=" << probe_timeout_.count()
                                                  << "ms)");
    return true;
}

void HealthProber::stop() {
    if (!running_.load()) return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();

    if (probe_thread_.joinable()) {
        probe_thread_.join();
    }
    running_.store(false);

    LOG_INFO("[Health] Prober stopped after " << rounds_.load() << " rounds");
}

execution::HealthProbeResult HealthProber::probe(const std::string &provider_name,
                                                 provider::IProviderAdapter &adapter) {
    execution::ExecutionContext ctx{execution::Deadline::after(probe_timeout_), execution::CancellationToken()};
    auto started = execution::Clock::now();

    execution::HealthProbeResult result;
    try {
        result = adapter.health_check(ctx);
    } catch (const std::exception &e) {
        LOG_ERROR("[Health] health_check threw for '" << provider_name << "': " << e.what());
        result.available = false;
        result.detail = std::string("health_check threw: ") + e.what();
    } catch (...) {
        LOG_ERROR("[Health] health_check threw unknown exception for '" << provider_name << "'");
        result.available = false;
        result.detail = "health_check threw unknown exception";
    }

    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(execution::Clock::now() - started).count();
    if (result.latency_ms <= 0) {
        result.latency_ms = elapsed;
    }
    if (result.available && elapsed > probe_timeout_.count()) {
        result.available = false;
        result.detail = "Probe exceeded " + std::to_string(probe_timeout_.count()) + "ms";
    }

    health_.record_probe(provider_name, result);
    return result;
}

void HealthProber::probe_all_once() {
    // Snapshot so adapters can be probed without holding the provider registry lock
    auto entries = providers_.get_all_providers();
    for (const auto &entry : entries) {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            if (stop_requested_) return;
        }
        probe(entry.descriptor.name, *entry.adapter);
    }
    rounds_.fetch_add(1);
}

void HealthProber::probe_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (wait_cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
        }
        probe_all_once();
    }
}

}  // namespace health
}  // namespace coderun
