#include "provider_registry.hpp"

#include <mutex>

#include "logging/logger.hpp"

namespace coderun {
namespace provider {

bool ProviderRegistry::add_provider(std::shared_ptr<IProviderAdapter> adapter) {
    if (!adapter) {
        return false;
    }

    // Query outside the lock; capabilities() is static but still foreign code
    auto descriptor = adapter->capabilities();
    if (descriptor.name.empty()) {
        LOG_ERROR("[Registry] Refusing provider with empty name");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(descriptor.name);
    if (it != index_.end()) {
        auto &entry = entries_[it->second];
        entry.descriptor = std::move(descriptor);
        entry.adapter = std::move(adapter);
        LOG_INFO("[Registry] Replaced provider '" << entry.descriptor.name << "'");
        return true;
    }

    Entry entry;
    entry.registration_index = entries_.size();
    entry.descriptor = std::move(descriptor);
    entry.adapter = std::move(adapter);
    index_.emplace(entry.descriptor.name, entries_.size());

    LOG_INFO("[Registry] Registered provider '" << entry.descriptor.name << "' ("
                                                << execution::provider_kind_to_string(entry.descriptor.kind)
                                                << ", priority " << entry.descriptor.priority << ", "
                                                << entry.descriptor.supported_languages.size() << " languages)");
    entries_.push_back(std::move(entry));
    return true;
}

std::shared_ptr<IProviderAdapter> ProviderRegistry::get_provider(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return entries_[it->second].adapter;
}

std::vector<ProviderRegistry::Entry> ProviderRegistry::get_all_providers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_;
}

std::vector<execution::ProviderDescriptor> ProviderRegistry::descriptors() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<execution::ProviderDescriptor> out;
    out.reserve(entries_.size());
    for (const auto &entry : entries_) {
        out.push_back(entry.descriptor);
    }
    return out;
}

std::vector<std::string> ProviderRegistry::get_provider_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto &entry : entries_) {
        names.push_back(entry.descriptor.name);
    }
    return names;
}

bool ProviderRegistry::has_provider(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.find(name) != index_.end();
}

size_t ProviderRegistry::provider_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void ProviderRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

}  // namespace provider
}  // namespace coderun
