#include "line_stream.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

namespace junkrat {

// ── LineBuffer ──────────────────────────────────────────────────

void LineBuffer::append(const char* data, size_t len) {
    // Compact consumed prefix before growing
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(data, len);
}

bool LineBuffer::next_line(std::string& line) {
    size_t newline = buffer_.find('\n', pos_);
    if (newline == std::string::npos) return false;

    line = buffer_.substr(pos_, newline - pos_);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    pos_ = newline + 1;
    return true;
}

std::string LineBuffer::take_remainder() {
    std::string rest = buffer_.substr(pos_);
    buffer_.clear();
    pos_ = 0;
    if (!rest.empty() && rest.back() == '\r') rest.pop_back();
    return rest;
}

// ── LineChatStream ──────────────────────────────────────────────

LineChatStream::LineChatStream(StreamOpener opener, LineDecoder decoder,
                               std::string provider_id, uint32_t max_malformed_run)
    : opener_(std::move(opener)),
      decoder_(std::move(decoder)),
      provider_id_(std::move(provider_id)),
      max_malformed_run_(max_malformed_run) {}

std::optional<StreamChunk> LineChatStream::next() {
    if (finished_) return std::nullopt;
    if (!opened_) open();

    while (pending_.empty()) {
        if (!body_) {
            // Transport ended without a done record
            push_terminal();
            break;
        }
        read_more();
    }

    StreamChunk chunk = std::move(pending_.front());
    pending_.pop_front();
    if (chunk.done) {
        finished_ = true;
        pending_.clear();
        body_.reset();
    }
    return chunk;
}

void LineChatStream::open() {
    opened_ = true;
    finished_ = true; // stays set if the opener throws
    OpenedStream opened = opener_();
    body_ = std::move(opened.body);
    token_ = std::move(opened.token);
    model_ = std::move(opened.model);
    finished_ = false;
}

void LineChatStream::read_more() {
    char buf[4096];
    long n = body_->read(buf, sizeof(buf));
    if (n < 0) {
        fail(classify_transport_error(provider_id_, "stream interrupted", token_));
    }
    if (n == 0) {
        std::string rest = lines_.take_remainder();
        if (!trim(rest).empty()) decode(rest);
        body_.reset();
        return;
    }

    lines_.append(buf, static_cast<size_t>(n));
    std::string line;
    while (!terminal_queued_ && lines_.next_line(line)) {
        decode(line);
    }
    if (terminal_queued_) body_.reset();
}

void LineChatStream::decode(const std::string& line) {
    if (terminal_queued_) return;

    StreamRecord record;
    LineStatus status;
    try {
        status = decoder_(line, record);
    } catch (const ProviderError& e) {
        fail(e);
    } catch (const nlohmann::json::exception&) {
        status = LineStatus::Malformed;
    }
    switch (status) {
        case LineStatus::Ignore:
            return;
        case LineStatus::Malformed:
            ++malformed_run_;
            if (max_malformed_run_ > 0 && malformed_run_ >= max_malformed_run_) {
                fail(ProviderError(ErrorKind::ApiError,
                                   "Stream aborted after " + std::to_string(malformed_run_) +
                                   " consecutive malformed lines",
                                   provider_id_));
            }
            return;
        case LineStatus::Record:
            break;
    }

    malformed_run_ = 0;
    if (record.model) model_ = record.model;
    if (record.finish_reason) finish_reason_ = record.finish_reason;

    if (!record.delta.empty()) {
        content_ += record.delta;
        StreamChunk chunk;
        chunk.delta = std::move(record.delta);
        chunk.model = model_;
        pending_.push_back(std::move(chunk));
    }
    if (record.done) push_terminal();
}

void LineChatStream::push_terminal() {
    if (terminal_queued_) return;
    terminal_queued_ = true;
    StreamChunk chunk;
    chunk.done = true;
    chunk.finish_reason = finish_reason_.value_or(FinishReason::Stop);
    chunk.model = model_;
    pending_.push_back(std::move(chunk));
}

void LineChatStream::fail(const ProviderError& error) {
    finished_ = true;
    pending_.clear();
    body_.reset();
    throw error;
}

} // namespace junkrat
