#include "http.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <string>

namespace junkrat {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// ── RAII curl transfer driven through the multi interface ─────

struct CurlTransfer {
    CURL*  curl  = curl_easy_init();
    CURLM* multi = curl_multi_init();
    curl_slist* hlist = nullptr;
    bool attached = false;

    std::string request_body; // POSTFIELDS is not copied by curl
    std::string buffer;       // received body bytes not yet handed out
    bool headers_done  = false;
    bool transfer_done = false;
    CURLcode result = CURLE_OK;

    CurlTransfer() = default;
    ~CurlTransfer() {
        if (attached) curl_multi_remove_handle(multi, curl);
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
        if (multi) curl_multi_cleanup(multi);
    }
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    explicit operator bool() const { return curl != nullptr && multi != nullptr; }

    // Advance the transfer by at most one poll slice (~1s).
    // Returns false if the token fired.
    bool pump(const CancellationToken& token) {
        if (token.is_cancelled()) return false;

        int running = 0;
        if (curl_multi_perform(multi, &running) != CURLM_OK) {
            result = CURLE_RECV_ERROR;
            transfer_done = true;
            return true;
        }
        if (running == 0) {
            int left = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi, &left)) {
                if (msg->msg == CURLMSG_DONE) result = msg->data.result;
            }
            transfer_done = true;
            return true;
        }
        int numfds = 0;
        curl_multi_poll(multi, nullptr, 0, 1000, &numfds);
        return !token.is_cancelled();
    }
};

static size_t body_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* t = static_cast<CurlTransfer*>(userdata);
    t->headers_done = true;
    t->buffer.append(ptr, total);
    return total;
}

// A blank header line closes a header block; interim 1xx blocks are skipped.
static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* t = static_cast<CurlTransfer*>(userdata);
    if (total <= 2 && (total == 0 || ptr[0] == '\r' || ptr[0] == '\n')) {
        long code = 0;
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &code);
        if (code >= 200) t->headers_done = true;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

static void setup_transfer(CurlTransfer& t, const std::string& url,
                           const std::vector<Header>& headers,
                           const CancellationToken& token) {
    t.hlist = build_headers(headers);
    curl_easy_setopt(t.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(t.curl, CURLOPT_HTTPHEADER, t.hlist);
    curl_easy_setopt(t.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(t.curl, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(t.curl, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(t.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(t.curl, CURLOPT_HEADERDATA, &t);
    if (auto left = token.remaining()) {
        curl_easy_setopt(t.curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(std::max<long long>(left->count(), 1)));
    }
}

static void set_post_body(CurlTransfer& t, const std::string& body) {
    t.request_body = body;
    curl_easy_setopt(t.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(t.curl, CURLOPT_POSTFIELDS, t.request_body.c_str());
    curl_easy_setopt(t.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(t.request_body.size()));
}

// ── Pull-based body reader ─────────────────────────────────────

class CurlHttpStream : public HttpStream {
public:
    CurlHttpStream(std::unique_ptr<CurlTransfer> transfer, long status,
                   CancellationToken token)
        : transfer_(std::move(transfer)), status_(status), token_(std::move(token)) {}

    long status_code() const override { return status_; }

    long read(char* buf, size_t len) override {
        auto& t = *transfer_;
        while (t.buffer.empty() && !t.transfer_done) {
            if (!t.pump(token_)) return -1;
        }
        if (!t.buffer.empty()) {
            size_t take = std::min(len, t.buffer.size());
            std::memcpy(buf, t.buffer.data(), take);
            t.buffer.erase(0, take);
            return static_cast<long>(take);
        }
        return t.result == CURLE_OK ? 0 : -1;
    }

private:
    std::unique_ptr<CurlTransfer> transfer_;
    long status_;
    CancellationToken token_;
};

static std::unique_ptr<CurlHttpStream> open_transfer(const std::string& url,
                                                     const std::string* body,
                                                     const std::vector<Header>& headers,
                                                     const CancellationToken& token,
                                                     std::string& error) {
    auto t = std::make_unique<CurlTransfer>();
    if (!*t) {
        error = "curl initialisation failed";
        return nullptr;
    }
    setup_transfer(*t, url, headers, token);
    if (body) set_post_body(*t, *body);
    else curl_easy_setopt(t->curl, CURLOPT_HTTPGET, 1L);

    curl_multi_add_handle(t->multi, t->curl);
    t->attached = true;

    while (!t->headers_done && !t->transfer_done) {
        if (!t->pump(token)) {
            error = "aborted while waiting for response";
            return nullptr;
        }
    }
    if (t->transfer_done && t->result != CURLE_OK) {
        error = curl_easy_strerror(t->result);
        return nullptr;
    }

    long status = 0;
    curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status == 0) {
        error = "no response status";
        return nullptr;
    }
    return std::make_unique<CurlHttpStream>(std::move(t), status, token);
}

static HttpResponse perform(const std::string& url,
                            const std::string* body,
                            const std::vector<Header>& headers,
                            const CancellationToken& token) {
    HttpResponse response;
    auto stream = open_transfer(url, body, headers, token, response.error);
    if (!stream) return response;

    std::string content;
    char buf[4096];
    long n;
    while ((n = stream->read(buf, sizeof(buf))) > 0)
        content.append(buf, static_cast<size_t>(n));
    if (n < 0) {
        response.error = token.is_cancelled() ? "aborted while reading response"
                                              : "connection lost while reading response";
        return response;
    }
    response.status_code = stream->status_code();
    response.body = std::move(content);
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  const CancellationToken& token) {
    return perform(url, nullptr, headers, token);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   const CancellationToken& token) {
    return perform(url, &body, headers, token);
}

std::unique_ptr<HttpStream> CurlHttpClient::open_stream(const std::string& url,
                                                        const std::string& body,
                                                        const std::vector<Header>& headers,
                                                        const CancellationToken& token,
                                                        std::string& error) {
    return open_transfer(url, &body, headers, token, error);
}

} // namespace junkrat
