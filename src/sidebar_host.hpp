#pragma once
#include "availability_poller.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "provider_registry.hpp"
#include "sidebar_protocol.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace junkrat {

// Receives one encoded outbound line (no trailing newline).
using MessageSink = std::function<void(const std::string& line)>;

// Bridges the sidebar protocol to the connectivity core.
//
// Inbound messages are handled on the caller's thread, except chat requests,
// which run on a single worker thread so cancelRequest can be served while
// a reply is in progress. Outbound messages may come from any thread; the
// sink is called under a mutex.
class SidebarHost {
public:
    SidebarHost(Config& config, ProviderRegistry& registry, EventBus& bus,
                AvailabilityPoller& poller, HttpClient& http, MessageSink sink);
    ~SidebarHost();

    SidebarHost(const SidebarHost&) = delete;
    SidebarHost& operator=(const SidebarHost&) = delete;

    // Decode and dispatch one line. Failures become an outbound error.
    void handle_line(const std::string& line);

    void dispatch(const InboundMessage& message);

    // Wait for the running chat request, if any.
    void wait_idle();

    // Cancel the running chat request and wait for it.
    void shutdown();

    const std::vector<ChatMessage>& history() const { return history_; }

private:
    void send(const OutboundMessage& message);

    void on_ready();
    void on_send(const SendChatMessage& msg);
    void on_cancel();
    void on_select_provider(const SelectProviderMessage& msg);
    void on_select_model(const SelectModelMessage& msg);
    void on_recheck();
    void on_defer_setup();
    void on_open_settings(const OpenSettingsMessage& msg);

    void send_provider_list();
    void send_model_list(const std::string& provider_id);
    void send_status();

    void run_chat(std::vector<ChatMessage> messages, bool stream, CancellationToken token);

    Config& config_;
    ProviderRegistry& registry_;
    EventBus& bus_;
    AvailabilityPoller& poller_;
    HttpClient& http_;
    MessageSink sink_;

    std::mutex send_mutex_;
    std::vector<ScopedSubscription> subscriptions_;
    std::atomic<bool> setup_deferred_{false};

    std::mutex chat_mutex_;
    std::thread worker_;
    std::atomic<bool> busy_{false};
    std::optional<CancellationSource> current_;
    std::vector<ChatMessage> history_; // guarded by chat_mutex_ while a chat runs
};

} // namespace junkrat
