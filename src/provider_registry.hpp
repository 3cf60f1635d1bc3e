#pragma once
#include "provider.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace junkrat {

// Registered adapters plus the single active-provider id.
//
// Adapters are handed out as shared_ptr so a caller (or the poller's probe)
// can keep using one after it was replaced or unregistered.
// All methods are thread-safe.
class ProviderRegistry {
public:
    // Adds `provider`, replacing an adapter with the same id in its slot.
    // The first adapter registered becomes active.
    void register_provider(std::unique_ptr<Provider> provider);

    // Returns true if found and removed. Removing the active adapter makes
    // the first remaining one active.
    bool unregister(const std::string& id);

    bool has_provider(const std::string& id) const;
    std::shared_ptr<Provider> get_provider(const std::string& id) const;

    // Ids in registration order.
    std::vector<std::string> list_providers() const;

    // Throws std::invalid_argument if `id` is not registered.
    void set_active_provider(const std::string& id);

    std::shared_ptr<Provider> get_active_provider() const;
    std::string active_id() const;

    // First registered adapter whose id is not in `exclude`, or nullptr.
    std::shared_ptr<Provider> get_next_available_provider(
        const std::vector<std::string>& exclude) const;

    // Probe one adapter; false if unknown. Runs outside the lock.
    bool check_provider_health(const std::string& id) const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Provider>> providers_;
    std::string active_id_;
};

} // namespace junkrat
