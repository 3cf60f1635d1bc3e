#pragma once
#include "cancellation.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace junkrat {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

// status_code 0 means the transport failed before a status line arrived;
// `error` then says why.
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;
};

// Pull-based response body of a streaming request. The connection stays
// open until the stream is destroyed.
class HttpStream {
public:
    virtual ~HttpStream() = default;

    virtual long status_code() const = 0;

    // Read the next body bytes (transfer encoding already removed).
    // Returns >0 on data, 0 at end of body, -1 on transport failure or
    // cancellation of the token the stream was opened with.
    virtual long read(char* buf, size_t len) = 0;

    // Drain the remaining body (used for error responses).
    std::string read_all() {
        std::string out;
        char buf[4096];
        long n;
        while ((n = read(buf, sizeof(buf))) > 0)
            out.append(buf, static_cast<size_t>(n));
        return out;
    }
};

// Abstract HTTP client interface (injectable for testing).
// Every call is bounded by `token`: cancellation or an expired deadline
// aborts the transfer within about a second.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             const CancellationToken& token) = 0;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              const CancellationToken& token) = 0;

    // POST and return once the status line and headers are in. Returns
    // nullptr if the connection could not be established; `error` is then
    // filled in.
    virtual std::unique_ptr<HttpStream> open_stream(const std::string& url,
                                                    const std::string& body,
                                                    const std::vector<Header>& headers,
                                                    const CancellationToken& token,
                                                    std::string& error) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     const CancellationToken& token) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      const CancellationToken& token) override;
    std::unique_ptr<HttpStream> open_stream(const std::string& url,
                                            const std::string& body,
                                            const std::vector<Header>& headers,
                                            const CancellationToken& token,
                                            std::string& error) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl (multi interface for pull-based streaming)
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     const CancellationToken& token) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      const CancellationToken& token) override;
    std::unique_ptr<HttpStream> open_stream(const std::string& url,
                                            const std::string& body,
                                            const std::vector<Header>& headers,
                                            const CancellationToken& token,
                                            std::string& error) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace junkrat
