#pragma once
#include "../http.hpp"
#include "../provider.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace junkrat {

// Splits a byte stream into lines, holding an incomplete trailing line
// across appends.
class LineBuffer {
public:
    void append(const char* data, size_t len);

    // Pop the next complete line, without '\n' or a trailing '\r'.
    bool next_line(std::string& line);

    // Whatever is left after the transport ended (clears the buffer).
    std::string take_remainder();

private:
    std::string buffer_;
    size_t pos_ = 0;
};

// One decoded wire record.
struct StreamRecord {
    std::string delta;
    bool done = false;
    std::optional<FinishReason> finish_reason;
    std::optional<std::string> model;
};

enum class LineStatus { Record, Ignore, Malformed };

// Decode one complete line into `record`. A decoder may throw ProviderError
// for an in-band backend error; the session then ends with that error.
using LineDecoder = std::function<LineStatus(const std::string& line, StreamRecord& record)>;

// A response body whose status was already checked, with the token its
// reads are bound to.
struct OpenedStream {
    std::unique_ptr<HttpStream> body;
    CancellationToken token;
    std::string model;
};

using StreamOpener = std::function<OpenedStream()>;

// ChatStream over a line-oriented HTTP body (NDJSON or SSE).
//
// The connection is opened by `opener` on the first next(). Malformed lines
// are skipped; `max_malformed_run` consecutive malformed lines abort the
// session (0 = never abort). If the body ends without a done record, one
// terminal chunk is synthesised. The body is released as soon as the
// terminal chunk is produced or a failure is thrown.
class LineChatStream : public ChatStream {
public:
    LineChatStream(StreamOpener opener, LineDecoder decoder,
                   std::string provider_id, uint32_t max_malformed_run);

    std::optional<StreamChunk> next() override;

    // Text accumulated so far.
    const std::string& content() const { return content_; }

private:
    void open();
    void read_more();
    void decode(const std::string& line);
    void push_terminal();
    [[noreturn]] void fail(const ProviderError& error);

    StreamOpener opener_;
    LineDecoder decoder_;
    std::string provider_id_;
    uint32_t max_malformed_run_;

    std::unique_ptr<HttpStream> body_;
    CancellationToken token_;
    LineBuffer lines_;
    std::deque<StreamChunk> pending_;
    std::string content_;
    std::optional<std::string> model_;
    std::optional<FinishReason> finish_reason_;
    uint32_t malformed_run_ = 0;
    bool opened_ = false;
    bool terminal_queued_ = false;
    bool finished_ = false;
};

} // namespace junkrat
