#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "execution/types.hpp"

namespace coderun {
namespace health {

struct HealthRecord {
    std::string provider_name;
    std::chrono::system_clock::time_point last_checked_at;
    bool is_available = false;
    int64_t last_latency_ms = 0;
    int consecutive_failures = 0;
};

// HealthRegistry tracks last-known availability per provider so the
// Supervisor can push known-bad providers to the back of the line.
//
// Locking: the name -> slot map is guarded by a shared_mutex and only grows;
// each record has its own mutex, so updates for one provider never block
// readers or writers of another. No I/O happens under any of these locks.
class HealthRegistry {
public:
    explicit HealthRegistry(int failure_threshold = 3);

    HealthRegistry(const HealthRegistry &) = delete;
    HealthRegistry &operator=(const HealthRegistry &) = delete;

    // Pre-allocate a slot. The record itself appears on first observation.
    void register_provider(const std::string &provider_name);

    // Periodic probe result
    void record_probe(const std::string &provider_name, const execution::HealthProbeResult &probe);

    // A real execute() reported ProviderUnavailable
    void record_unavailable(const std::string &provider_name, const std::string &reason);

    // A real execute() reached the backend (any outcome other than ProviderUnavailable)
    void record_success(const std::string &provider_name, int64_t latency_ms);

    // Copy of the record; nullopt if the provider was never observed
    std::optional<HealthRecord> snapshot(const std::string &provider_name) const;
    std::unordered_map<std::string, HealthRecord> snapshot_all() const;

    // True when the record says unavailable or failures reached the threshold.
    // Unobserved providers are not demoted.
    bool is_demoted(const std::string &provider_name) const;

    // Stable re-ordering: demoted providers move to the back, nothing is dropped
    std::vector<execution::ProviderDescriptor> rank(const std::vector<execution::ProviderDescriptor> &candidates) const;

    int failure_threshold() const { return failure_threshold_; }

private:
    struct Slot {
        mutable std::mutex mutex;
        std::optional<HealthRecord> record;
    };

    // Slots are never erased, so returned pointers stay valid for the registry's lifetime
    Slot *find_slot(const std::string &provider_name) const;
    Slot &slot_for(const std::string &provider_name);

    template <typename Fn>
    void update(const std::string &provider_name, Fn &&fn);

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
    int failure_threshold_;
};

}  // namespace health
}  // namespace coderun
