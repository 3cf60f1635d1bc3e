// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl): http_init/cleanup
// are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

namespace junkrat {

// Upper bound for connect + TLS handshake when the token carries no deadline.
static constexpr long kDefaultConnectTimeoutSecs = 30;

void http_init() {}
void http_cleanup() {}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static std::optional<ParsedUrl> parse_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    ParsedUrl result;
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty()) return std::nullopt;
    return result;
}

static long connect_timeout_secs(const CancellationToken& token) {
    auto left = token.remaining();
    if (!left) return kDefaultConnectTimeoutSecs;
    long secs = static_cast<long>((left->count() + 999) / 1000);
    return std::max(secs, 1L);
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    CancellationToken token;

    explicit Connection(CancellationToken t) : token(std::move(t)) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, std::string& error) {
        long timeout_secs = connect_timeout_secs(token);

        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0) {
            error = "could not resolve host " + url.host;
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so the deadline is honoured.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = token.is_cancelled() ? "aborted while connecting"
                                         : "connection to " + url.host + ":" + url.port + " failed";
            return false;
        }

        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS context allocation failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS session allocation failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                error = "TLS handshake with " + url.host + " failed";
                return false;
            }
        }

        // 1-second slice timeout for body I/O so cancellation is observed.
        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or
    // cancellation. Slice expiry loops back to re-check the token.
    long read_some(char* buf, size_t len) {
        while (true) {
            if (token.is_cancelled()) return -1;

            if (ssl) {
                int n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                return n == 0 ? 0 : -1;
            }

            ssize_t n = ::recv(fd, buf, len, 0);
            if (n > 0) return static_cast<long>(n);
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (token.is_cancelled()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF or error before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        long n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

enum class BodyFraming { Chunked, Length, UntilClose };

struct ResponseHead {
    long status = 0;
    BodyFraming framing = BodyFraming::UntilClose;
    size_t content_length = 0;
};

// Parse status line + headers. status stays 0 on a malformed response.
static ResponseHead parse_response_head(Connection& conn, std::string& leftover) {
    ResponseHead head;

    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return head;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) return head;
    long status = std::strtol(status_line.substr(sp1 + 1, 3).c_str(), nullptr, 10);
    if (status < 100 || status > 599) return head;

    bool have_length = false;
    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) {
            head.status = status; // blank line → end of headers
            break;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding" && value.find("chunked") != std::string::npos) {
            head.framing = BodyFraming::Chunked;
        } else if (name == "content-length") {
            head.content_length = std::strtoul(value.c_str(), nullptr, 10);
            have_length = true;
        }
    }
    if (head.framing != BodyFraming::Chunked && have_length)
        head.framing = BodyFraming::Length;
    return head;
}

// ── Pull-based body reader ─────────────────────────────────────

class SocketHttpStream : public HttpStream {
public:
    SocketHttpStream(std::unique_ptr<Connection> conn, std::string leftover,
                     const ResponseHead& head)
        : conn_(std::move(conn)), leftover_(std::move(leftover)),
          status_(head.status), framing_(head.framing),
          remaining_(head.content_length) {
        if (framing_ == BodyFraming::Length && remaining_ == 0) finished_ = true;
    }

    long status_code() const override { return status_; }

    long read(char* buf, size_t len) override {
        if (finished_ || len == 0) return 0;

        switch (framing_) {
            case BodyFraming::Chunked:    return read_chunked(buf, len);
            case BodyFraming::Length:     return read_bounded(buf, len);
            case BodyFraming::UntilClose: return read_raw(buf, len);
        }
        return -1;
    }

private:
    // Serve from look-ahead first, then the socket.
    long read_raw(char* buf, size_t len) {
        if (!leftover_.empty()) {
            size_t take = std::min(len, leftover_.size());
            std::memcpy(buf, leftover_.data(), take);
            leftover_.erase(0, take);
            return static_cast<long>(take);
        }
        long n = conn_->read_some(buf, len);
        if (n == 0) finished_ = true;
        return n;
    }

    long read_bounded(char* buf, size_t len) {
        long n = read_raw(buf, std::min(len, remaining_));
        if (n > 0) {
            remaining_ -= static_cast<size_t>(n);
            if (remaining_ == 0) finished_ = true;
        }
        return n;
    }

    long read_chunked(char* buf, size_t len) {
        if (remaining_ == 0) {
            std::string line;
            if (need_crlf_) {
                if (!read_line(*conn_, leftover_, line)) return eof_or_error();
                need_crlf_ = false;
            }
            if (!read_line(*conn_, leftover_, line)) return eof_or_error();
            // Chunk size is hex, may have extensions after ';'
            remaining_ = std::strtoul(line.c_str(), nullptr, 16);
            if (remaining_ == 0) {
                finished_ = true;
                return 0;
            }
        }

        long n = read_raw(buf, std::min(len, remaining_));
        if (n > 0) {
            remaining_ -= static_cast<size_t>(n);
            if (remaining_ == 0) need_crlf_ = true;
        } else if (n == 0) {
            finished_ = true; // server closed mid-chunk
        }
        return n;
    }

    long eof_or_error() {
        finished_ = true;
        return conn_->token.is_cancelled() ? -1 : 0;
    }

    std::unique_ptr<Connection> conn_;
    std::string leftover_;
    long status_;
    BodyFraming framing_;
    size_t remaining_;
    bool need_crlf_ = false;
    bool finished_ = false;
};

// Connect, send the request and parse the response head.
static std::unique_ptr<SocketHttpStream> open_request(const std::string& method,
                                                      const std::string& url_str,
                                                      const std::string& body,
                                                      const std::vector<Header>& headers,
                                                      const CancellationToken& token,
                                                      std::string& error) {
    auto url = parse_url(url_str);
    if (!url) {
        error = "invalid URL: " + url_str;
        return nullptr;
    }

    auto conn = std::make_unique<Connection>(token);
    if (!conn->connect(*url, error)) return nullptr;

    std::string request = build_request(method, *url, body, headers);
    if (!conn->write_all(request.c_str(), request.size())) {
        error = "failed to send request to " + url->host;
        return nullptr;
    }

    std::string leftover;
    ResponseHead head = parse_response_head(*conn, leftover);
    if (head.status == 0) {
        error = token.is_cancelled() ? "aborted while waiting for response"
                                     : "malformed or missing response from " + url->host;
        return nullptr;
    }
    return std::make_unique<SocketHttpStream>(std::move(conn), std::move(leftover), head);
}

static HttpResponse do_request(const std::string& method,
                                const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                const CancellationToken& token) {
    HttpResponse resp;
    auto stream = open_request(method, url, body, headers, token, resp.error);
    if (!stream) return resp;

    std::string content;
    char buf[4096];
    long n;
    while ((n = stream->read(buf, sizeof(buf))) > 0)
        content.append(buf, static_cast<size_t>(n));
    if (n < 0) {
        resp.error = token.is_cancelled() ? "aborted while reading response"
                                          : "connection lost while reading response";
        return resp;
    }

    resp.status_code = stream->status_code();
    resp.body = std::move(content);
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    const CancellationToken& token) {
    return do_request("GET", url, "", headers, token);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     const CancellationToken& token) {
    return do_request("POST", url, body, headers, token);
}

std::unique_ptr<HttpStream> SocketHttpClient::open_stream(const std::string& url,
                                                          const std::string& body,
                                                          const std::vector<Header>& headers,
                                                          const CancellationToken& token,
                                                          std::string& error) {
    return open_request("POST", url, body, headers, token, error);
}

} // namespace junkrat

#endif // __linux__
