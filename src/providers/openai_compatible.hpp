#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include "line_stream.hpp"
#include <string>

namespace junkrat {

// OpenAI-style /chat/completions endpoint (Gemini, OpenRouter, custom).
class OpenAICompatibleProvider : public Provider {
public:
    OpenAICompatibleProvider(ProviderConfig config, HttpClient& http, bool requires_api_key);

    ChatResponse chat(const ChatRequest& request) override;
    std::unique_ptr<ChatStream> stream_chat(const ChatRequest& request) override;

    bool is_available() override;
    std::vector<std::string> list_models() override;
    std::vector<ModelInfo> list_models_with_details() override { return {}; }

    bool requires_api_key() const { return requires_api_key_; }

private:
    ChatResponse chat_once(const ChatRequest& request);
    OpenedStream open_stream_once(const ChatRequest& request);
    void require_key() const;

    std::vector<Header> build_headers() const;
    std::string build_body(const ChatRequest& request, bool stream) const;

    HttpClient& http_;
    bool requires_api_key_;
};

FinishReason map_openai_finish_reason(const std::string& reason);

// Decode one SSE line of a streamed completion. Non-data fields and
// comments are ignored; "data: [DONE]" ends the stream.
LineStatus decode_sse_line(const std::string& line, StreamRecord& record,
                           const std::string& provider_id);

} // namespace junkrat
