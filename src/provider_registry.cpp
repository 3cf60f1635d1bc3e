#include "provider_registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace junkrat {

void ProviderRegistry::register_provider(std::unique_ptr<Provider> provider) {
    if (!provider) throw std::invalid_argument("Cannot register a null provider");

    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<Provider> shared(std::move(provider));
    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [&](const std::shared_ptr<Provider>& p) {
                               return p->id() == shared->id();
                           });
    if (it != providers_.end()) {
        *it = std::move(shared);
    } else {
        providers_.push_back(std::move(shared));
    }
    if (active_id_.empty()) active_id_ = providers_.front()->id();
}

bool ProviderRegistry::unregister(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [&](const std::shared_ptr<Provider>& p) { return p->id() == id; });
    if (it == providers_.end()) return false;

    providers_.erase(it);
    if (active_id_ == id) {
        active_id_ = providers_.empty() ? std::string() : providers_.front()->id();
    }
    return true;
}

bool ProviderRegistry::has_provider(const std::string& id) const {
    return get_provider(id) != nullptr;
}

std::shared_ptr<Provider> ProviderRegistry::get_provider(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : providers_) {
        if (p->id() == id) return p;
    }
    return nullptr;
}

std::vector<std::string> ProviderRegistry::list_providers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(providers_.size());
    for (const auto& p : providers_) ids.push_back(p->id());
    return ids;
}

void ProviderRegistry::set_active_provider(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool known = std::any_of(providers_.begin(), providers_.end(),
                             [&](const std::shared_ptr<Provider>& p) { return p->id() == id; });
    if (!known) throw std::invalid_argument("Provider not registered: " + id);
    active_id_ = id;
}

std::shared_ptr<Provider> ProviderRegistry::get_active_provider() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : providers_) {
        if (p->id() == active_id_) return p;
    }
    return nullptr;
}

std::string ProviderRegistry::active_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_id_;
}

std::shared_ptr<Provider> ProviderRegistry::get_next_available_provider(
    const std::vector<std::string>& exclude) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : providers_) {
        if (std::find(exclude.begin(), exclude.end(), p->id()) == exclude.end()) return p;
    }
    return nullptr;
}

bool ProviderRegistry::check_provider_health(const std::string& id) const {
    auto provider = get_provider(id);
    return provider && provider->is_available();
}

size_t ProviderRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

void ProviderRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.clear();
    active_id_.clear();
}

} // namespace junkrat
