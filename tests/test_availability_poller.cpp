#include <catch2/catch_test_macros.hpp>
#include "availability_poller.hpp"
#include "fake_provider.hpp"
#include "manual_scheduler.hpp"

using namespace junkrat;
using namespace std::chrono_literals;

namespace {

// Registry with one fake target plus a recorder for every poller event.
struct PollerFixture {
    ProviderRegistry registry;
    EventBus bus;
    ManualScheduler scheduler;
    std::shared_ptr<FakeProvider> ollama;

    std::vector<ProviderStatusEvent> statuses;
    std::vector<SetupAdvisoryEvent> advisories;
    std::vector<PollIntervalChangedEvent> interval_changes;
    std::vector<AvailabilityExhaustedEvent> exhausted;
    std::vector<ModelsRefreshedEvent> refreshed;
    std::vector<std::chrono::milliseconds> advisory_times;
    std::vector<std::chrono::milliseconds> exhausted_times;

    explicit PollerFixture(bool available) {
        auto fake = std::make_unique<FakeProvider>("ollama", "Ollama");
        fake->available = available;
        registry.register_provider(std::move(fake));
        ollama = std::static_pointer_cast<FakeProvider>(registry.get_provider("ollama"));

        subscribe<ProviderStatusEvent>(bus, [this](const ProviderStatusEvent& e) {
            statuses.push_back(e);
        });
        subscribe<SetupAdvisoryEvent>(bus, [this](const SetupAdvisoryEvent& e) {
            advisories.push_back(e);
            advisory_times.push_back(scheduler.now());
        });
        subscribe<PollIntervalChangedEvent>(bus, [this](const PollIntervalChangedEvent& e) {
            interval_changes.push_back(e);
        });
        subscribe<AvailabilityExhaustedEvent>(bus, [this](const AvailabilityExhaustedEvent& e) {
            exhausted.push_back(e);
            exhausted_times.push_back(scheduler.now());
        });
        subscribe<ModelsRefreshedEvent>(bus, [this](const ModelsRefreshedEvent& e) {
            refreshed.push_back(e);
        });
    }
};

} // namespace

// ── Initial check ───────────────────────────────────────────────

TEST_CASE("Poller: available target is checked once and left alone", "[poller]") {
    PollerFixture f(true);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);

    poller.start();

    REQUIRE(f.ollama->probe_count == 1);
    REQUIRE(f.statuses.size() == 1);
    REQUIRE(f.statuses[0].available);
    REQUIRE_FALSE(f.statuses[0].changed);
    REQUIRE(f.statuses[0].provider_id == "ollama");

    auto snap = poller.snapshot();
    REQUIRE(snap.phase == PollerPhase::Available);
    REQUIRE_FALSE(snap.timer_armed);
    REQUIRE(f.scheduler.pending() == 0);
}

TEST_CASE("Poller: unavailable target is re-checked on the base interval", "[poller]") {
    PollerFixture f(false);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);

    poller.start();

    REQUIRE(f.statuses.size() == 1);
    REQUIRE_FALSE(f.statuses[0].available);
    REQUIRE(poller.snapshot().phase == PollerPhase::UnavailableWaiting);
    REQUIRE(poller.snapshot().attempt_count == 0);
    REQUIRE(f.scheduler.next_delay() == 10000ms);

    f.scheduler.advance(9999ms);
    REQUIRE(f.ollama->probe_count == 1);
    f.scheduler.advance(1ms);
    REQUIRE(f.ollama->probe_count == 2);
    REQUIRE(poller.snapshot().attempt_count == 1);
}

// ── Unavailable timeline ────────────────────────────────────────

TEST_CASE("Poller: advisory, backoff and exhaustion timeline", "[poller]") {
    PollerFixture f(false);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();

    f.scheduler.advance(30s);
    REQUIRE(f.advisories.size() == 1);
    REQUIRE(f.advisory_times[0] == 30s);
    REQUIRE(f.advisories[0].attempt_count == 3);
    REQUIRE(f.advisories[0].provider_id == "ollama");
    REQUIRE(poller.snapshot().advisory_sent);

    f.scheduler.advance(70s); // t = 100s, attempt 10
    REQUIRE(poller.snapshot().attempt_count == 10);
    REQUIRE(f.interval_changes.size() == 1);
    REQUIRE(f.interval_changes[0].interval == 30000ms);
    REQUIRE(f.interval_changes[0].attempt_count == 10);
    REQUIRE(f.interval_changes[0].backoff_multiplier == 3);
    REQUIRE(poller.current_interval() == 30000ms);
    REQUIRE(f.scheduler.next_delay() == 30000ms);

    f.scheduler.advance(599s);
    REQUIRE(f.exhausted.empty());
    f.scheduler.advance(1s); // t = 700s, attempt 30
    REQUIRE(f.exhausted.size() == 1);
    REQUIRE(f.exhausted_times[0] == 700s);
    REQUIRE(f.exhausted[0].attempt_count == 30);
    REQUIRE(f.exhausted[0].message.find("ollama serve") != std::string::npos);

    auto snap = poller.snapshot();
    REQUIRE(snap.phase == PollerPhase::Exhausted);
    REQUIRE_FALSE(snap.timer_armed);

    // Nothing further: the advisory and backoff fired once each
    REQUIRE(f.ollama->probe_count == 31);
    f.scheduler.advance(3600s);
    REQUIRE(f.ollama->probe_count == 31);
    REQUIRE(f.advisories.size() == 1);
    REQUIRE(f.interval_changes.size() == 1);
    REQUIRE(f.exhausted.size() == 1);
}

TEST_CASE("Poller: only the initial check publishes status while down", "[poller]") {
    PollerFixture f(false);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();
    f.scheduler.advance(100s);
    REQUIRE(f.statuses.size() == 1);
}

TEST_CASE("Poller: custom policy", "[poller]") {
    PollerFixture f(false);
    PollerPolicy policy;
    policy.base_interval = 1000ms;
    policy.early_warning_attempts = 1;
    policy.backoff_threshold = 2;
    policy.backoff_factor = 2;
    policy.max_attempts = 4;
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler, policy);
    poller.start();

    f.scheduler.advance(1000ms);
    REQUIRE(f.advisories.size() == 1);
    f.scheduler.advance(1000ms);
    REQUIRE(poller.current_interval() == 2000ms);
    f.scheduler.advance(4000ms); // attempts 3 and 4
    REQUIRE(f.exhausted.size() == 1);
    REQUIRE(f.exhausted[0].message.find("ollama serve") != std::string::npos);
}

TEST_CASE("Poller: unlimited attempts never exhaust", "[poller]") {
    PollerFixture f(false);
    PollerPolicy policy;
    policy.max_attempts = 0;
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler, policy);
    poller.start();

    f.scheduler.advance(7200s);
    REQUIRE(f.exhausted.empty());
    REQUIRE(poller.snapshot().phase == PollerPhase::UnavailableWaiting);
    REQUIRE(f.scheduler.pending() == 1);
}

// ── Recovery ────────────────────────────────────────────────────

TEST_CASE("Poller: recovery resets the baseline and refreshes models", "[poller]") {
    PollerFixture f(false);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();

    f.scheduler.advance(100s);
    REQUIRE(poller.snapshot().backoff_multiplier == 3);

    f.ollama->available = true;
    f.scheduler.advance(30s);

    auto snap = poller.snapshot();
    REQUIRE(snap.phase == PollerPhase::Available);
    REQUIRE(snap.available);
    REQUIRE(snap.attempt_count == 0);
    REQUIRE(snap.backoff_multiplier == 1);
    REQUIRE_FALSE(snap.advisory_sent);
    REQUIRE_FALSE(snap.timer_armed);

    REQUIRE(f.statuses.size() == 2);
    REQUIRE(f.statuses[1].available);
    REQUIRE(f.statuses[1].changed);

    REQUIRE(f.refreshed.size() == 1);
    REQUIRE(f.refreshed[0].provider_id == "ollama");
    REQUIRE(f.refreshed[0].models == std::vector<std::string>{"model-a", "model-b"});
}

TEST_CASE("Poller: no model refresh for static catalogues", "[poller]") {
    PollerFixture f(false);
    f.ollama->listing_supported = false;
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();

    f.ollama->available = true;
    f.scheduler.advance(10s);
    REQUIRE(poller.snapshot().available);
    REQUIRE(f.refreshed.empty());
    REQUIRE(f.ollama->list_count == 0);
}

TEST_CASE("Poller: keep polling detects a disconnect", "[poller]") {
    PollerFixture f(true);
    PollerPolicy policy;
    policy.keep_polling_when_available = true;
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler, policy);
    poller.start();

    REQUIRE(f.scheduler.next_delay() == 60000ms);
    f.scheduler.advance(60s);
    REQUIRE(f.ollama->probe_count == 2);
    REQUIRE(f.statuses.size() == 1);

    f.ollama->available = false;
    f.scheduler.advance(60s);
    REQUIRE(f.statuses.size() == 2);
    REQUIRE_FALSE(f.statuses[1].available);
    REQUIRE(f.statuses[1].changed);
    REQUIRE(poller.snapshot().phase == PollerPhase::UnavailableWaiting);
    REQUIRE(poller.snapshot().attempt_count == 0);
    REQUIRE(f.scheduler.next_delay() == 10000ms);

    f.ollama->available = true;
    f.scheduler.advance(10s);
    REQUIRE(f.statuses.size() == 3);
    REQUIRE(f.statuses[2].available);
    REQUIRE(f.scheduler.next_delay() == 60000ms);
}

// ── Explicit control ────────────────────────────────────────────

TEST_CASE("Poller: check_now revives an exhausted poller", "[poller]") {
    PollerFixture f(false);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();
    f.scheduler.advance(700s);
    REQUIRE(poller.snapshot().phase == PollerPhase::Exhausted);

    poller.check_now();

    auto snap = poller.snapshot();
    REQUIRE(snap.phase == PollerPhase::UnavailableWaiting);
    REQUIRE(snap.attempt_count == 0);
    REQUIRE(snap.backoff_multiplier == 1);
    REQUIRE(f.ollama->probe_count == 32);
    REQUIRE(f.scheduler.next_delay() == 10000ms);

    // A fresh advisory is possible after the reset
    f.scheduler.advance(30s);
    REQUIRE(f.advisories.size() == 2);
}

TEST_CASE("Poller: check_now during a probe adopts its result", "[poller]") {
    PollerFixture f(true);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);

    bool rechecked = false;
    f.ollama->on_probe = [&]() {
        if (!rechecked) {
            rechecked = true;
            poller.check_now();
        }
    };
    poller.start();

    REQUIRE(f.ollama->probe_count == 1);
    REQUIRE(f.statuses.size() == 1);
    REQUIRE(poller.snapshot().phase == PollerPhase::Available);
}

TEST_CASE("Poller: set_target mid-probe re-probes the new target", "[poller]") {
    PollerFixture f(false);
    auto gemini = std::make_unique<FakeProvider>("gemini", "Google Gemini");
    f.registry.register_provider(std::move(gemini));
    auto target = std::static_pointer_cast<FakeProvider>(f.registry.get_provider("gemini"));

    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    bool switched = false;
    f.ollama->on_probe = [&]() {
        if (!switched) {
            switched = true;
            poller.set_target("gemini");
        }
    };
    poller.start();

    REQUIRE(f.ollama->probe_count == 1);
    REQUIRE(target->probe_count == 1);
    REQUIRE(f.statuses.size() == 1);
    REQUIRE(f.statuses[0].provider_id == "gemini");
    REQUIRE(f.statuses[0].available);
    REQUIRE(poller.snapshot().provider_id == "gemini");
}

TEST_CASE("Poller: set_target restarts with a clean baseline", "[poller]") {
    PollerFixture f(false);
    f.registry.register_provider(std::make_unique<FakeProvider>("custom"));
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();
    f.scheduler.advance(50s);
    REQUIRE(poller.snapshot().attempt_count == 5);

    poller.set_target("custom");
    auto snap = poller.snapshot();
    REQUIRE(snap.provider_id == "custom");
    REQUIRE(snap.phase == PollerPhase::Available);
    REQUIRE(snap.attempt_count == 0);
    REQUIRE(f.scheduler.pending() == 0);

    // The old target's timer is gone
    int before = f.ollama->probe_count;
    f.scheduler.advance(60s);
    REQUIRE(f.ollama->probe_count == before);
}

TEST_CASE("Poller: stop cancels the pending tick", "[poller]") {
    PollerFixture f(false);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.start();
    REQUIRE(f.scheduler.pending() == 1);

    poller.stop();
    REQUIRE(f.scheduler.pending() == 0);
    REQUIRE(poller.snapshot().phase == PollerPhase::Init);

    f.scheduler.advance(60s);
    REQUIRE(f.ollama->probe_count == 1);
}

TEST_CASE("Poller: unknown target reads as unavailable", "[poller]") {
    PollerFixture f(true);
    AvailabilityPoller poller(f.registry, f.bus, f.scheduler);
    poller.set_target("missing");

    REQUIRE(poller.snapshot().phase == PollerPhase::UnavailableWaiting);
    REQUIRE(f.statuses.size() == 1);
    REQUIRE_FALSE(f.statuses[0].available);
}

TEST_CASE("poller_phase_to_string", "[poller]") {
    REQUIRE(std::string(poller_phase_to_string(PollerPhase::UnavailableWaiting)) ==
            "unavailable_waiting");
    REQUIRE(std::string(poller_phase_to_string(PollerPhase::Exhausted)) == "exhausted");
}
