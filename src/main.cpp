#include "availability_poller.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "provider_registry.hpp"
#include "scheduler.hpp"
#include "sidebar_host.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cerr << "Usage: junkrat-core [options]\n"
              << "\n"
              << "Speaks newline-delimited JSON with the editor sidebar on stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --provider NAME      Start with a specific provider\n"
              << "                       (ollama, gemini, openrouter, custom, gemini-cli)\n"
              << "  --model NAME         Override the model of that provider\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GEMINI_API_KEY       API key for Google Gemini\n"
              << "  OPENROUTER_API_KEY   API key for OpenRouter\n"
              << "  CUSTOM_API_KEY       API key for the custom endpoint\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://127.0.0.1:11434)\n"
              << "  CUSTOM_BASE_URL      Base URL for the custom endpoint\n"
              << "  JUNKRAT_PROVIDER     Provider to start with\n";
}

int main(int argc, char* argv[]) try {
    std::string provider_name;
    std::string model_name;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    junkrat::http_init();
    auto config = junkrat::Config::load();

    // Override config with CLI args
    if (!provider_name.empty()) {
        config.provider(provider_name); // throws for an unknown id
        config.active_provider = provider_name;
    }
    if (!model_name.empty()) {
        config.providers[config.active_provider].model = model_name;
    }

    junkrat::PlatformHttpClient http_client;
    junkrat::ProviderRegistry registry;
    for (const auto& id : junkrat::known_provider_ids()) {
        registry.register_provider(junkrat::create_provider(config.provider(id), http_client));
    }
    registry.set_active_provider(config.active_provider);

    junkrat::EventBus bus;
    junkrat::TimerThread timer;
    junkrat::AvailabilityPoller poller(registry, bus, timer, config.poller);
    junkrat::SidebarHost host(config, registry, bus, poller, http_client,
        [](const std::string& line) {
            std::cout << line << '\n' << std::flush;
        });

    std::cerr << "[host] junkrat-core ready, provider: " << registry.active_id() << "\n";
    poller.start();

    std::string line;
    while (!g_shutdown.load() && std::getline(std::cin, line)) {
        if (junkrat::trim(line).empty()) continue;
        host.handle_line(line);
    }

    // Timer callbacks reference the poller; stop them before teardown
    host.shutdown();
    timer.stop();
    poller.stop();
    junkrat::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
