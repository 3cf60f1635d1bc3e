#pragma once
#include "../provider.hpp"
#include <string>

namespace junkrat {

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool aborted = false;   // token fired; the child was killed
    std::string spawn_error;
};

// Run `command_line` under /bin/sh, capturing stdout and stderr separately.
// The child is killed as soon as `token` fires.
ProcessResult run_process(const std::string& command_line, const CancellationToken& token);

// Drives a command-line assistant: `<command> '<last message>'`.
class CliProvider : public Provider {
public:
    explicit CliProvider(ProviderConfig config);

    ChatResponse chat(const ChatRequest& request) override;

    // Runs the command once; yields a single terminal chunk with the full text.
    std::unique_ptr<ChatStream> stream_chat(const ChatRequest& request) override;

    bool is_available() override;
    std::vector<std::string> list_models() override { return {config().model}; }
    bool supports_model_listing() const override { return false; }

private:
    ChatResponse chat_once(const ChatRequest& request);
};

} // namespace junkrat
