#include "availability_poller.hpp"
#include <iostream>

namespace junkrat {

const char* poller_phase_to_string(PollerPhase phase) {
    switch (phase) {
        case PollerPhase::Init: return "init";
        case PollerPhase::Checking: return "checking";
        case PollerPhase::Available: return "available";
        case PollerPhase::UnavailableWaiting: return "unavailable_waiting";
        case PollerPhase::Exhausted: return "exhausted";
    }
    return "init";
}

AvailabilityPoller::AvailabilityPoller(ProviderRegistry& registry, EventBus& bus,
                                       Scheduler& scheduler, PollerPolicy policy)
    : registry_(registry), bus_(bus), scheduler_(scheduler), policy_(policy) {}

AvailabilityPoller::~AvailabilityPoller() {
    stop();
}

// ── Control ─────────────────────────────────────────────────────

void AvailabilityPoller::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    state_.provider_id = registry_.active_id();
    restart(lock);
}

void AvailabilityPoller::check_now() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_.provider_id.empty()) state_.provider_id = registry_.active_id();
    restart(lock);
}

void AvailabilityPoller::set_target(const std::string& provider_id) {
    std::unique_lock<std::mutex> lock(mutex_);
    state_.provider_id = provider_id;
    state_.available = false;
    restart(lock);
}

void AvailabilityPoller::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.generation;
    state_.adopt_in_flight = false;
    cancel_timer();
    state_.phase = PollerPhase::Init;
}

// Reset and probe as on start(). Called with the lock held; returns unlocked.
void AvailabilityPoller::restart(std::unique_lock<std::mutex>& lock) {
    ++state_.generation;
    cancel_timer();
    reset_baseline();
    state_.phase = PollerPhase::Checking;

    if (state_.in_flight) {
        // One probe at a time: its result becomes this check's result
        state_.adopt_in_flight = true;
        lock.unlock();
        return;
    }

    state_.in_flight = true;
    uint64_t generation = state_.generation;
    std::string provider_id = state_.provider_id;
    lock.unlock();
    run_probe(generation, std::move(provider_id), true);
}

void AvailabilityPoller::tick(uint64_t generation) {
    std::string provider_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != state_.generation) return;
        state_.timer = 0;

        if (state_.in_flight) {
            std::cerr << "[poller] Probe still running for " << state_.provider_id
                      << ", skipping tick\n";
            schedule(state_.available ? policy_.healthy_interval : unavailable_interval());
            return;
        }
        state_.in_flight = true;
        if (!state_.available) ++state_.attempt_count;
        provider_id = state_.provider_id;
    }
    run_probe(generation, std::move(provider_id), false);
}

void AvailabilityPoller::run_probe(uint64_t generation, std::string provider_id, bool initial) {
    while (true) {
        bool available = !provider_id.empty() && registry_.check_provider_health(provider_id);

        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_.in_flight = false;
            if (generation != state_.generation) {
                if (!state_.adopt_in_flight) return;
                state_.adopt_in_flight = false;
                generation = state_.generation;
                initial = true;
                if (provider_id != state_.provider_id) {
                    // Answer for the previous target; probe the new one
                    provider_id = state_.provider_id;
                    state_.in_flight = true;
                    continue;
                }
            }

            if (initial) apply_initial(available, outbox);
            else apply_tick(available, outbox);
        }

        for (auto& deliver : outbox) deliver();
        return;
    }
}

// ── Transitions (lock held) ─────────────────────────────────────

void AvailabilityPoller::apply_initial(bool available, Outbox& outbox) {
    state_.available = available;
    if (available) {
        state_.phase = PollerPhase::Available;
        publish_status(outbox, false);
        if (policy_.keep_polling_when_available) schedule(policy_.healthy_interval);
        return;
    }

    std::cerr << "[poller] " << state_.provider_id << " unavailable, polling every "
              << unavailable_interval().count() << "ms\n";
    state_.phase = PollerPhase::UnavailableWaiting;
    publish_status(outbox, false);
    schedule(unavailable_interval());
}

void AvailabilityPoller::apply_tick(bool available, Outbox& outbox) {
    if (available) {
        if (!state_.available) {
            on_recovered(outbox);
        } else {
            schedule(policy_.healthy_interval);
        }
        return;
    }

    if (state_.available) {
        // Lost while keep-polling
        std::cerr << "[poller] " << state_.provider_id << " became unavailable\n";
        reset_baseline();
        state_.available = false;
        state_.phase = PollerPhase::UnavailableWaiting;
        publish_status(outbox, true);
        schedule(unavailable_interval());
        return;
    }

    const std::string id = state_.provider_id;
    const uint32_t attempt = state_.attempt_count;

    if (policy_.max_attempts > 0 && attempt >= policy_.max_attempts) {
        std::cerr << "[poller] " << id << " still unavailable after " << attempt
                  << " attempts, giving up\n";
        state_.phase = PollerPhase::Exhausted;

        AvailabilityExhaustedEvent ev;
        ev.provider_id = id;
        ev.attempt_count = attempt;
        std::string name = provider_name(id);
        ev.message = name + " is still not reachable after " + std::to_string(attempt) +
                     " checks. " +
                     (id == "ollama"
                          ? "Start Ollama (ollama serve) or choose another provider, then recheck."
                          : "Check its settings or choose another provider, then recheck.");
        outbox.push_back([this, ev]() { bus_.publish(ev); });
        return;
    }

    if (!state_.advisory_sent && attempt == policy_.early_warning_attempts) {
        state_.advisory_sent = true;
        SetupAdvisoryEvent ev;
        ev.provider_id = id;
        ev.attempt_count = attempt;
        ev.message = provider_name(id) + " is not responding yet. Set it up now, or continue "
                     "and we will keep checking in the background.";
        outbox.push_back([this, ev]() { bus_.publish(ev); });
    }

    if (attempt == policy_.backoff_threshold && policy_.backoff_factor > 1) {
        state_.backoff_multiplier *= policy_.backoff_factor;
        std::cerr << "[poller] " << id << " backing off to "
                  << unavailable_interval().count() << "ms\n";

        PollIntervalChangedEvent ev;
        ev.provider_id = id;
        ev.interval = unavailable_interval();
        ev.attempt_count = attempt;
        ev.backoff_multiplier = state_.backoff_multiplier;
        outbox.push_back([this, ev]() { bus_.publish(ev); });
    }

    schedule(unavailable_interval());
}

void AvailabilityPoller::on_recovered(Outbox& outbox) {
    std::cerr << "[poller] " << state_.provider_id << " is available after "
              << state_.attempt_count << " attempts\n";
    reset_baseline();
    state_.available = true;
    state_.phase = PollerPhase::Available;
    publish_status(outbox, true);

    auto provider = registry_.get_provider(state_.provider_id);
    if (provider && provider->supports_model_listing()) {
        outbox.push_back([this, provider]() {
            ModelsRefreshedEvent ev;
            ev.provider_id = provider->id();
            ev.models = provider->list_models();
            bus_.publish(ev);
        });
    }

    if (policy_.keep_polling_when_available) schedule(policy_.healthy_interval);
}

void AvailabilityPoller::publish_status(Outbox& outbox, bool changed) const {
    ProviderStatusEvent ev;
    ev.provider_id = state_.provider_id;
    ev.available = state_.available;
    ev.attempt_count = state_.attempt_count;
    ev.changed = changed;
    outbox.push_back([this, ev]() { bus_.publish(ev); });
}

// ── Helpers (lock held) ─────────────────────────────────────────

void AvailabilityPoller::reset_baseline() {
    state_.attempt_count = 0;
    state_.backoff_multiplier = 1;
    state_.advisory_sent = false;
}

void AvailabilityPoller::schedule(std::chrono::milliseconds delay) {
    cancel_timer();
    uint64_t generation = state_.generation;
    state_.timer = scheduler_.schedule_after(delay, [this, generation]() { tick(generation); });
}

void AvailabilityPoller::cancel_timer() {
    if (state_.timer != 0) {
        scheduler_.cancel(state_.timer);
        state_.timer = 0;
    }
}

std::string AvailabilityPoller::provider_name(const std::string& id) const {
    auto provider = registry_.get_provider(id);
    return provider ? provider->name() : id;
}

std::chrono::milliseconds AvailabilityPoller::unavailable_interval() const {
    return policy_.base_interval * state_.backoff_multiplier;
}

std::chrono::milliseconds AvailabilityPoller::current_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unavailable_interval();
}

PollerSnapshot AvailabilityPoller::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PollerSnapshot snap;
    snap.phase = state_.phase;
    snap.provider_id = state_.provider_id;
    snap.available = state_.available;
    snap.attempt_count = state_.attempt_count;
    snap.backoff_multiplier = state_.backoff_multiplier;
    snap.advisory_sent = state_.advisory_sent;
    snap.timer_armed = state_.timer != 0;
    return snap;
}

} // namespace junkrat
