#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include "line_stream.hpp"
#include <string>

namespace junkrat {

// Local Ollama server (/api/chat, /api/tags, /api/ps).
class OllamaProvider : public Provider {
public:
    OllamaProvider(ProviderConfig config, HttpClient& http);

    ChatResponse chat(const ChatRequest& request) override;
    std::unique_ptr<ChatStream> stream_chat(const ChatRequest& request) override;

    bool is_available() override;

    std::vector<std::string> list_models() override;
    std::vector<ModelInfo> list_models_with_details() override;
    std::vector<ModelInfo> list_running_models() override;

private:
    ChatResponse chat_once(const ChatRequest& request);
    OpenedStream open_stream_once(const ChatRequest& request);

    std::string build_body(const ChatRequest& request, const std::string& model,
                           bool stream) const;
    std::vector<ModelInfo> fetch_models(const std::string& path,
                                        std::chrono::milliseconds bound);

    HttpClient& http_;
};

// Decode one NDJSON record of an /api/chat stream.
LineStatus decode_ollama_line(const std::string& line, StreamRecord& record);

} // namespace junkrat
