#include "health_registry.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace coderun {
namespace health {

HealthRegistry::HealthRegistry(int failure_threshold) : failure_threshold_(std::max(1, failure_threshold)) {}

void HealthRegistry::register_provider(const std::string &provider_name) {
    slot_for(provider_name);
    LOG_DEBUG("[Health] Tracking provider '" << provider_name << "'");
}

HealthRegistry::Slot *HealthRegistry::find_slot(const std::string &provider_name) const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    auto it = slots_.find(provider_name);
    if (it == slots_.end()) {
        return nullptr;
    }
    return it->second.get();
}

HealthRegistry::Slot &HealthRegistry::slot_for(const std::string &provider_name) {
    if (auto *slot = find_slot(provider_name)) {
        return *slot;
    }

    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    auto &slot = slots_[provider_name];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

template <typename Fn>
void HealthRegistry::update(const std::string &provider_name, Fn &&fn) {
    auto &slot = slot_for(provider_name);
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (!slot.record) {
        HealthRecord record;
        record.provider_name = provider_name;
        slot.record = record;
    }
    slot.record->last_checked_at = std::chrono::system_clock::now();
    fn(*slot.record);
}

void HealthRegistry::record_probe(const std::string &provider_name, const execution::HealthProbeResult &probe) {
    bool was_available = true;
    int failures = 0;
    update(provider_name, [&](HealthRecord &record) {
        was_available = record.is_available || record.consecutive_failures == 0;
        record.is_available = probe.available;
        record.last_latency_ms = probe.latency_ms;
        record.consecutive_failures = probe.available ? 0 : record.consecutive_failures + 1;
        failures = record.consecutive_failures;
    });

    if (!probe.available) {
        LOG_WARN("[Health] Probe failed for '" << provider_name << "' (" << failures
                                               << " consecutive): " << probe.detail);
    } else if (!was_available) {
        LOG_INFO("[Health] Provider '" << provider_name << "' recovered (" << probe.latency_ms << "ms)");
    } else {
        LOG_DEBUG("[Health] Probe ok for '" << provider_name << "' (" << probe.latency_ms << "ms)");
    }
}

void HealthRegistry::record_unavailable(const std::string &provider_name, const std::string &reason) {
    int failures = 0;
    update(provider_name, [&failures](HealthRecord &record) {
        record.is_available = false;
        record.consecutive_failures += 1;
        failures = record.consecutive_failures;
    });
    LOG_WARN("[Health] Provider '" << provider_name << "' marked unavailable (" << failures
                                   << " consecutive): " << reason);
}

void HealthRegistry::record_success(const std::string &provider_name, int64_t latency_ms) {
    update(provider_name, [latency_ms](HealthRecord &record) {
        record.is_available = true;
        record.last_latency_ms = latency_ms;
        record.consecutive_failures = 0;
    });
}

std::optional<HealthRecord> HealthRegistry::snapshot(const std::string &provider_name) const {
    auto *slot = find_slot(provider_name);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->record;
}

std::unordered_map<std::string, HealthRecord> HealthRegistry::snapshot_all() const {
    // Collect slot pointers first; per-record locks are taken one at a time
    std::vector<std::pair<std::string, Slot *>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        slots.reserve(slots_.size());
        for (const auto &[name, slot] : slots_) {
            slots.emplace_back(name, slot.get());
        }
    }

    std::unordered_map<std::string, HealthRecord> out;
    out.reserve(slots.size());
    for (const auto &[name, slot] : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->record) {
            out.emplace(name, *slot->record);
        }
    }
    return out;
}

bool HealthRegistry::is_demoted(const std::string &provider_name) const {
    auto *slot = find_slot(provider_name);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->record) {
        return false;
    }
    return !slot->record->is_available || slot->record->consecutive_failures >= failure_threshold_;
}

std::vector<execution::ProviderDescriptor> HealthRegistry::rank(
    const std::vector<execution::ProviderDescriptor> &candidates) const {
    std::vector<execution::ProviderDescriptor> ranked;
    std::vector<execution::ProviderDescriptor> demoted;
    ranked.reserve(candidates.size());

    for (const auto &candidate : candidates) {
        if (is_demoted(candidate.name)) {
            demoted.push_back(candidate);
        } else {
            ranked.push_back(candidate);
        }
    }

    ranked.insert(ranked.end(), demoted.begin(), demoted.end());
    return ranked;
}

}  // namespace health
}  // namespace coderun
