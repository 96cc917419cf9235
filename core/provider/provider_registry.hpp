#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "i_provider_adapter.hpp"

namespace coderun {
namespace provider {

/**
 * @brief Thread-safe registry of provider adapters
 *
 * Keeps adapters in registration order, which is the tie-breaker the
 * LanguageRouter uses between providers of equal priority. Descriptors are
 * captured at registration so lookups never call into an adapter.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Reads (get_provider, get_all_providers, descriptors) take a shared lock
 * - add_provider() and clear() take an exclusive lock
 *
 * Usage Pattern:
 * ```cpp
 * registry.add_provider(std::make_shared<CloudSandboxProvider>(cloud_cfg));
 * if (auto adapter = registry.get_provider("cloud")) {
 *     adapter->execute(ctx, request);
 * }
 * ```
 */
class ProviderRegistry {
public:
    struct Entry {
        execution::ProviderDescriptor descriptor;
        size_t registration_index = 0;
        std::shared_ptr<IProviderAdapter> adapter;
    };

    ProviderRegistry() = default;
    ~ProviderRegistry() = default;

    // Non-copyable, non-movable (manages mutex)
    ProviderRegistry(const ProviderRegistry &) = delete;
    ProviderRegistry &operator=(const ProviderRegistry &) = delete;
    ProviderRegistry(ProviderRegistry &&) = delete;
    ProviderRegistry &operator=(ProviderRegistry &&) = delete;

    /**
     * @brief Register an adapter under its descriptor name
     *
     * Re-registering an existing name replaces the adapter but keeps its
     * original registration position.
     *
     * @param adapter Adapter to register (must not be null)
     * @return false if adapter is null or its descriptor has an empty name
     */
    bool add_provider(std::shared_ptr<IProviderAdapter> adapter);

    /**
     * @brief Get an adapter by name
     *
     * The returned shared_ptr keeps the adapter alive even if the registry is
     * cleared while a request is still using it.
     *
     * @return Adapter or nullptr if not registered
     */
    std::shared_ptr<IProviderAdapter> get_provider(const std::string &name) const;

    // Snapshot of all entries in registration order
    std::vector<Entry> get_all_providers() const;

    // Snapshot of descriptors in registration order
    std::vector<execution::ProviderDescriptor> descriptors() const;

    std::vector<std::string> get_provider_names() const;
    bool has_provider(const std::string &name) const;
    size_t provider_count() const;

    // Used during shutdown
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;  // name -> position in entries_
};

}  // namespace provider
}  // namespace coderun
