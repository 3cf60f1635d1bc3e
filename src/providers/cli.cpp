#include "cli.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace junkrat {

static constexpr std::chrono::milliseconds kProbeTimeout{5000};
static constexpr int kPollSliceMs = 200;

namespace {

// Owns a forked child and its output pipes; kills and reaps on destruction.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess() {
        if (pid_ > 0) {
            // The child leads its own process group; take its children down too
            kill(-pid_, SIGKILL);
            int status = 0;
            waitpid(pid_, &status, 0);
        }
        close_fd(out_fd_);
        close_fd(err_fd_);
    }
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool spawn(const std::string& command_line, std::string& error) {
        int out_pipe[2];
        int err_pipe[2];
        if (pipe(out_pipe) != 0) {
            error = std::string("pipe: ") + std::strerror(errno);
            return false;
        }
        if (pipe(err_pipe) != 0) {
            error = std::string("pipe: ") + std::strerror(errno);
            close(out_pipe[0]);
            close(out_pipe[1]);
            return false;
        }

        pid_t pid = fork();
        if (pid < 0) {
            error = std::string("fork: ") + std::strerror(errno);
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            return false;
        }

        if (pid == 0) {
            setsid();
            close(out_pipe[0]);
            close(err_pipe[0]);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[1]);
            close(err_pipe[1]);
            // No stdin: the prompt travels as an argument
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
            execl("/bin/sh", "sh", "-c", command_line.c_str(), nullptr);
            _exit(127);
        }

        close(out_pipe[1]);
        close(err_pipe[1]);
        pid_ = pid;
        out_fd_ = out_pipe[0];
        err_fd_ = err_pipe[0];
        return true;
    }

    // Drain both pipes until EOF. Returns false if the token fired first.
    bool drain(std::string& out, std::string& err, const CancellationToken& token) {
        std::array<char, 4096> buffer;
        while (out_fd_ >= 0 || err_fd_ >= 0) {
            if (token.is_cancelled()) return false;

            struct pollfd fds[2];
            nfds_t count = 0;
            int* owners[2];
            std::string* sinks[2];
            if (out_fd_ >= 0) {
                fds[count] = {out_fd_, POLLIN, 0};
                owners[count] = &out_fd_;
                sinks[count] = &out;
                ++count;
            }
            if (err_fd_ >= 0) {
                fds[count] = {err_fd_, POLLIN, 0};
                owners[count] = &err_fd_;
                sinks[count] = &err;
                ++count;
            }

            int ret = poll(fds, count, kPollSliceMs);
            if (ret < 0) {
                if (errno == EINTR) continue;
                return true;
            }
            for (nfds_t i = 0; i < count; ++i) {
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
                ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
                if (n > 0) {
                    sinks[i]->append(buffer.data(), static_cast<size_t>(n));
                } else {
                    close_fd(*owners[i]);
                }
            }
        }
        return true;
    }

    // Reap the child. Returns false if the token fired first.
    bool wait(int& exit_code, const CancellationToken& token) {
        while (true) {
            int status = 0;
            pid_t result = waitpid(pid_, &status, WNOHANG);
            if (result == pid_) {
                pid_ = -1;
                exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                return true;
            }
            if (result < 0 && errno != EINTR) {
                pid_ = -1;
                exit_code = -1;
                return true;
            }
            if (token.wait_for(std::chrono::milliseconds(kPollSliceMs))) return false;
        }
    }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    pid_t pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
};

// Yields the whole reply as one terminal chunk on the first next().
class SingleShotStream : public ChatStream {
public:
    SingleShotStream(CliProvider& provider, ChatRequest request)
        : provider_(provider), request_(std::move(request)) {}

    std::optional<StreamChunk> next() override {
        if (finished_) return std::nullopt;
        finished_ = true;

        ChatResponse response = provider_.chat(request_);
        StreamChunk chunk;
        chunk.delta = std::move(response.content);
        chunk.done = true;
        chunk.finish_reason = response.finish_reason;
        chunk.model = std::move(response.model);
        return chunk;
    }

private:
    CliProvider& provider_;
    ChatRequest request_;
    bool finished_ = false;
};

} // namespace

ProcessResult run_process(const std::string& command_line, const CancellationToken& token) {
    ProcessResult result;
    ChildProcess child;
    if (!child.spawn(command_line, result.spawn_error)) return result;

    if (!child.drain(result.out, result.err, token) || !child.wait(result.exit_code, token)) {
        result.aborted = true;
    }
    return result;
}

// ── CliProvider ─────────────────────────────────────────────────

CliProvider::CliProvider(ProviderConfig config) : Provider(std::move(config)) {}

ChatResponse CliProvider::chat(const ChatRequest& request) {
    try {
        return retry([&] { return chat_once(request); }, retry_options(request));
    } catch (const std::exception& e) {
        throw classify_error(e, id(), name() + " failed");
    }
}

ChatResponse CliProvider::chat_once(const ChatRequest& request) {
    if (request.messages.empty()) {
        throw ProviderError(ErrorKind::InvalidRequest, "No message to send", id());
    }

    auto call = CancellationSource::linked(request.token, config().timeout);
    std::string command_line = config().command + " " +
                               shell_quote(request.messages.back().content);

    ProcessResult result = run_process(command_line, call.token());
    if (!result.spawn_error.empty()) {
        throw ProviderError(ErrorKind::ApiError,
                            "Could not start " + config().command + ": " + result.spawn_error,
                            id());
    }
    if (result.aborted) {
        throw classify_transport_error(id(), config().command + " aborted", call.token());
    }
    if (result.exit_code != 0) {
        std::string detail = trim(result.err.empty() ? result.out : result.err);
        throw ProviderError(ErrorKind::ApiError,
                            config().command + " exited with status " +
                                std::to_string(result.exit_code) +
                                (detail.empty() ? "" : ": " + detail),
                            id());
    }
    if (!trim(result.err).empty()) {
        std::cerr << "[" << id() << "] stderr: " << trim(result.err) << '\n';
    }

    ChatResponse response;
    response.id = std::to_string(epoch_millis());
    response.content = trim(result.out);
    response.model = config().model;
    response.finish_reason = FinishReason::Stop;
    return response;
}

std::unique_ptr<ChatStream> CliProvider::stream_chat(const ChatRequest& request) {
    return std::make_unique<SingleShotStream>(*this, request);
}

bool CliProvider::is_available() {
    auto probe = CancellationSource::linked(CancellationToken(), kProbeTimeout);
    ProcessResult result = run_process(config().command + " --version", probe.token());
    return result.spawn_error.empty() && !result.aborted && result.exit_code == 0;
}

} // namespace junkrat
