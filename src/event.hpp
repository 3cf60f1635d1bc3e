#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace junkrat {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ProviderStatus        = "ProviderStatus";
    constexpr const char* SetupAdvisory         = "SetupAdvisory";
    constexpr const char* PollIntervalChanged   = "PollIntervalChanged";
    constexpr const char* AvailabilityExhausted = "AvailabilityExhausted";
    constexpr const char* ModelsRefreshed       = "ModelsRefreshed";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// Published after every initial check and on every availability transition.
struct ProviderStatusEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderStatus;
    std::string provider_id;
    bool available = false;
    uint32_t attempt_count = 0;
    bool changed = false; // true for a transition, false for an initial check

    ProviderStatusEvent() { type_tag = TAG; }
};

// The provider has stayed unreachable long enough that the user should be
// offered a way to configure it now or defer.
struct SetupAdvisoryEvent : Event {
    static constexpr const char* TAG = event_tags::SetupAdvisory;
    std::string provider_id;
    uint32_t attempt_count = 0;
    std::string message;

    SetupAdvisoryEvent() { type_tag = TAG; }
};

struct PollIntervalChangedEvent : Event {
    static constexpr const char* TAG = event_tags::PollIntervalChanged;
    std::string provider_id;
    std::chrono::milliseconds interval{0};
    uint32_t attempt_count = 0;
    uint32_t backoff_multiplier = 1;

    PollIntervalChangedEvent() { type_tag = TAG; }
};

// Terminal: polling stopped after the attempt budget ran out.
struct AvailabilityExhaustedEvent : Event {
    static constexpr const char* TAG = event_tags::AvailabilityExhausted;
    std::string provider_id;
    uint32_t attempt_count = 0;
    std::string message;

    AvailabilityExhaustedEvent() { type_tag = TAG; }
};

struct ModelsRefreshedEvent : Event {
    static constexpr const char* TAG = event_tags::ModelsRefreshed;
    std::string provider_id;
    std::vector<std::string> models;

    ModelsRefreshedEvent() { type_tag = TAG; }
};

} // namespace junkrat
