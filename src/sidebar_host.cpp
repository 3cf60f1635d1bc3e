#include "sidebar_host.hpp"
#include "errors.hpp"
#include <iostream>

namespace junkrat {

SidebarHost::SidebarHost(Config& config, ProviderRegistry& registry, EventBus& bus,
                         AvailabilityPoller& poller, HttpClient& http, MessageSink sink)
    : config_(config), registry_(registry), bus_(bus), poller_(poller), http_(http),
      sink_(std::move(sink)) {
    subscriptions_.emplace_back(bus_, subscribe<ProviderStatusEvent>(bus_,
        [this](const ProviderStatusEvent& ev) {
            send(ProviderStatusMessage{ev.provider_id, ev.available, ev.attempt_count});
        }));
    subscriptions_.emplace_back(bus_, subscribe<SetupAdvisoryEvent>(bus_,
        [this](const SetupAdvisoryEvent& ev) {
            if (setup_deferred_.load()) return;
            send(SetupAdvisoryMessage{ev.provider_id, ev.attempt_count, ev.message});
        }));
    subscriptions_.emplace_back(bus_, subscribe<PollIntervalChangedEvent>(bus_,
        [this](const PollIntervalChangedEvent& ev) {
            send(PollIntervalChangedMessage{ev.provider_id,
                                            static_cast<long long>(ev.interval.count()),
                                            ev.attempt_count});
        }));
    subscriptions_.emplace_back(bus_, subscribe<AvailabilityExhaustedEvent>(bus_,
        [this](const AvailabilityExhaustedEvent& ev) {
            send(ProvidersExhaustedMessage{ev.provider_id, ev.attempt_count, ev.message});
        }));
    subscriptions_.emplace_back(bus_, subscribe<ModelsRefreshedEvent>(bus_,
        [this](const ModelsRefreshedEvent& ev) {
            send_model_list(ev.provider_id);
        }));
}

SidebarHost::~SidebarHost() {
    subscriptions_.clear();
    shutdown();
}

// ── Dispatch boundary ───────────────────────────────────────────

void SidebarHost::handle_line(const std::string& line) {
    try {
        dispatch(decode_inbound(line));
    } catch (const ProtocolError& e) {
        std::cerr << "[host] " << e.what() << '\n';
        send(make_protocol_error(e.what()));
    } catch (const std::exception& e) {
        std::cerr << "[host] Request failed: " << e.what() << '\n';
        ErrorMessage msg;
        msg.report = report_error(e, registry_.active_id(), registry_);
        send(msg);
    }
}

void SidebarHost::dispatch(const InboundMessage& message) {
    std::visit(Overloaded{
        [this](const ReadyMessage&) { on_ready(); },
        [this](const SendChatMessage& m) { on_send(m); },
        [this](const CancelRequestMessage&) { on_cancel(); },
        [this](const SelectProviderMessage& m) { on_select_provider(m); },
        [this](const RequestProviderListMessage&) { send_provider_list(); },
        [this](const RequestModelListMessage&) { send_model_list(registry_.active_id()); },
        [this](const SelectModelMessage& m) { on_select_model(m); },
        [this](const RecheckProviderMessage&) { on_recheck(); },
        [this](const DeferSetupMessage&) { on_defer_setup(); },
        [this](const OpenSettingsMessage& m) { on_open_settings(m); },
    }, message);
}

void SidebarHost::send(const OutboundMessage& message) {
    std::string line = encode_outbound(message);
    std::lock_guard<std::mutex> lock(send_mutex_);
    sink_(line);
}

// ── Handlers ────────────────────────────────────────────────────

void SidebarHost::on_ready() {
    send_provider_list();
    send_status();
    auto provider = registry_.get_active_provider();
    if (provider && provider->supports_model_listing()) send_model_list(provider->id());
}

void SidebarHost::on_send(const SendChatMessage& msg) {
    if (busy_.load()) {
        ErrorMessage err = make_protocol_error("A request is already in progress");
        err.report.provider_id = registry_.active_id();
        send(err);
        return;
    }
    wait_idle();

    std::vector<ChatMessage> messages;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(chat_mutex_);
        messages = history_;
        messages.push_back({Role::User, msg.text});
        current_.emplace();
        token = current_->token();
    }

    busy_.store(true);
    worker_ = std::thread([this, messages = std::move(messages), stream = msg.stream, token]() {
        run_chat(messages, stream, token);
        busy_.store(false);
    });
}

void SidebarHost::on_cancel() {
    std::lock_guard<std::mutex> lock(chat_mutex_);
    if (current_) {
        std::cerr << "[host] Cancelling request\n";
        current_->cancel();
    }
}

void SidebarHost::on_select_provider(const SelectProviderMessage& msg) {
    if (!registry_.has_provider(msg.provider_id))
        throw ProtocolError("Unknown provider: " + msg.provider_id);
    registry_.set_active_provider(msg.provider_id);
    config_.active_provider = msg.provider_id;
    if (!config_.persist_selection())
        std::cerr << "[host] Could not persist provider selection\n";

    setup_deferred_.store(false);
    send_provider_list();
    poller_.set_target(msg.provider_id);
}

void SidebarHost::on_select_model(const SelectModelMessage& msg) {
    auto active = registry_.get_active_provider();
    if (!active) throw ProtocolError("No active provider");

    // Adapters are immutable; a new model means a new adapter
    ProviderConfig updated = active->config();
    updated.model = msg.model;
    registry_.register_provider(create_provider(updated, http_));
    config_.providers[updated.id] = updated;
    if (!config_.persist_selection())
        std::cerr << "[host] Could not persist model selection\n";

    send_provider_list();
    send_model_list(updated.id);
}

void SidebarHost::on_recheck() {
    setup_deferred_.store(false);
    poller_.check_now();
}

void SidebarHost::on_defer_setup() {
    setup_deferred_.store(true);
}

void SidebarHost::on_open_settings(const OpenSettingsMessage& msg) {
    // Settings UI belongs to the editor; reload what it may have changed
    std::cerr << "[host] Settings requested"
              << (msg.setting_id ? " (" + *msg.setting_id + ")" : std::string()) << '\n';
    send_provider_list();
}

// ── Outbound helpers ────────────────────────────────────────────

void SidebarHost::send_provider_list() {
    ProviderListMessage list;
    list.active_id = registry_.active_id();
    for (const auto& id : registry_.list_providers()) {
        auto provider = registry_.get_provider(id);
        if (!provider) continue;
        list.providers.push_back({id, provider->name(), provider->config().model,
                                  id == list.active_id});
    }
    send(list);
}

void SidebarHost::send_model_list(const std::string& provider_id) {
    auto provider = registry_.get_provider(provider_id);
    if (!provider) return;

    ModelListMessage list;
    list.provider_id = provider_id;
    list.models = provider->list_models_with_details();
    list.current_model = provider->config().model;
    send(list);
}

void SidebarHost::send_status() {
    PollerSnapshot snap = poller_.snapshot();
    if (snap.provider_id.empty()) return;
    send(ProviderStatusMessage{snap.provider_id, snap.available, snap.attempt_count});
}

// ── Chat worker ─────────────────────────────────────────────────

void SidebarHost::run_chat(std::vector<ChatMessage> messages, bool stream,
                           CancellationToken token) {
    auto provider = registry_.get_active_provider();
    if (!provider) {
        ErrorMessage err;
        err.report.kind = ErrorKind::InvalidRequest;
        err.report.message = "No provider is configured";
        err.report.actions = suggest_actions(nullptr, registry_);
        send(err);
        return;
    }

    ChatRequest request;
    request.messages = messages;
    request.stream = stream;
    request.token = token;

    try {
        std::string content;
        if (stream) {
            auto chunks = provider->stream_chat(request);
            while (auto chunk = chunks->next()) {
                content += chunk->delta;
                send(StreamChunkMessage{*chunk});
            }
        } else {
            ChatResponse response = provider->chat(request);
            content = response.content;
            send(AssistantReplyMessage{response});
        }

        std::lock_guard<std::mutex> lock(chat_mutex_);
        history_.push_back(messages.back());
        history_.push_back({Role::Assistant, content});
    } catch (const std::exception& e) {
        std::cerr << "[host] " << provider->id() << " request failed: " << e.what() << '\n';
        ErrorMessage err;
        err.report = report_error(e, provider->id(), registry_,
                                  [this](const std::string& id) { send_model_list(id); });
        send(err);
    }

    std::lock_guard<std::mutex> lock(chat_mutex_);
    current_.reset();
}

void SidebarHost::wait_idle() {
    if (worker_.joinable()) worker_.join();
}

void SidebarHost::shutdown() {
    on_cancel();
    wait_idle();
}

} // namespace junkrat
