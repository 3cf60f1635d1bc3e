#include "event_bus.hpp"
#include <algorithm>

namespace junkrat {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    auto slot = std::make_shared<Slot>();
    slot->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);
    slot->id = next_id_++;
    slots_[tag].push_back(slot);
    return slot->id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto entry = slots_.begin(); entry != slots_.end(); ++entry) {
        auto& list = entry->second;
        auto it = std::find_if(list.begin(), list.end(),
                               [id](const std::shared_ptr<Slot>& s) { return s->id == id; });
        if (it == list.end()) continue;

        (*it)->live.store(false);
        list.erase(it);
        if (list.empty()) slots_.erase(entry);
        return true;
    }
    return false;
}

void EventBus::publish(const Event& event) {
    std::vector<std::shared_ptr<Slot>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(event.type_tag);
        if (it == slots_.end()) return;
        snapshot = it->second;
    }
    for (const auto& slot : snapshot) {
        // Dropped by an earlier handler or another thread since the snapshot
        if (!slot->live.load()) continue;
        slot->handler(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : slots_) {
        for (auto& slot : entry.second) slot->live.store(false);
    }
    slots_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(tag);
    return it == slots_.end() ? 0 : it->second.size();
}

} // namespace junkrat
