#pragma once
#include "event_bus.hpp"
#include "provider_registry.hpp"
#include "scheduler.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace junkrat {

struct PollerPolicy {
    std::chrono::milliseconds base_interval{10000};
    uint32_t early_warning_attempts = 3;
    uint32_t backoff_threshold = 10;
    uint32_t backoff_factor = 3;
    uint32_t max_attempts = 30;
    bool keep_polling_when_available = false;
    std::chrono::milliseconds healthy_interval{60000};
};

enum class PollerPhase { Init, Checking, Available, UnavailableWaiting, Exhausted };

const char* poller_phase_to_string(PollerPhase phase);

struct PollerSnapshot {
    PollerPhase phase = PollerPhase::Init;
    std::string provider_id;
    bool available = false;
    uint32_t attempt_count = 0;
    uint32_t backoff_multiplier = 1;
    bool advisory_sent = false;
    bool timer_armed = false;
};

// Adaptive reachability polling for one target provider.
//
// start() probes once on the calling thread. While the target stays
// unreachable it is re-probed every base_interval * backoff_multiplier;
// the multiplier grows once at backoff_threshold, an advisory fires once at
// early_warning_attempts, and polling stops for good at max_attempts until
// check_now() or set_target(). All transitions are published on the bus.
//
// The poller only reads the registry's active id. The scheduler must not
// run callbacks after the poller is destroyed.
class AvailabilityPoller {
public:
    AvailabilityPoller(ProviderRegistry& registry, EventBus& bus, Scheduler& scheduler,
                       PollerPolicy policy = {});
    ~AvailabilityPoller();

    AvailabilityPoller(const AvailabilityPoller&) = delete;
    AvailabilityPoller& operator=(const AvailabilityPoller&) = delete;

    // Target the registry's active provider and run the initial check.
    void start();

    // Explicit re-check: reset to baseline and run the initial check again,
    // also out of Exhausted.
    void check_now();

    // Follow an explicit provider selection.
    void set_target(const std::string& provider_id);

    // Cancel the pending tick; a probe already running is discarded.
    void stop();

    PollerSnapshot snapshot() const;
    const PollerPolicy& policy() const { return policy_; }

    // Poll interval currently in effect for the unavailable loop.
    std::chrono::milliseconds current_interval() const;

private:
    struct State {
        PollerPhase phase = PollerPhase::Init;
        std::string provider_id;
        bool available = false;
        uint32_t attempt_count = 0;
        uint32_t backoff_multiplier = 1;
        bool advisory_sent = false;

        bool in_flight = false;
        bool adopt_in_flight = false; // the running probe answers a restart
        uint64_t generation = 0;
        TimerId timer = 0;
    };

    using Outbox = std::vector<std::function<void()>>;

    void restart(std::unique_lock<std::mutex>& lock);
    void tick(uint64_t generation);
    void run_probe(uint64_t generation, std::string provider_id, bool initial);

    void apply_initial(bool available, Outbox& outbox);
    void apply_tick(bool available, Outbox& outbox);
    void on_recovered(Outbox& outbox);

    void reset_baseline();
    std::chrono::milliseconds unavailable_interval() const;
    void schedule(std::chrono::milliseconds delay);
    void cancel_timer();
    std::string provider_name(const std::string& id) const;

    void publish_status(Outbox& outbox, bool changed) const;

    ProviderRegistry& registry_;
    EventBus& bus_;
    Scheduler& scheduler_;
    const PollerPolicy policy_;

    mutable std::mutex mutex_;
    State state_;
};

} // namespace junkrat
