#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace junkrat {

enum class CancelReason { None, Cancelled, TimedOut };

namespace detail {

struct CancelState {
    static constexpr int64_t kNoDeadline = std::numeric_limits<int64_t>::max();

    std::atomic<bool> cancelled{false};
    std::atomic<int64_t> deadline_ns{kNoDeadline}; // steady_clock ticks
    std::shared_ptr<CancelState> parent;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::weak_ptr<CancelState>> children;

    CancelReason reason() const;
    std::optional<std::chrono::steady_clock::time_point> deadline() const;
};

} // namespace detail

// Read-only view of a cancellation source. A default-constructed token is
// never cancelled. Tokens are cheap to copy and safe to share across threads.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const { return reason() != CancelReason::None; }
    CancelReason reason() const;

    // Block for up to `duration`, returning early on cancellation.
    // Returns true if the token was cancelled (or its deadline passed).
    bool wait_for(std::chrono::milliseconds duration) const;

    // Time left until the deadline, if this token (or an ancestor) has one.
    std::optional<std::chrono::milliseconds> remaining() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

// Owner side of a cancellation signal.
//
// linked() composes an external token with a per-call timeout: the child is
// cancelled when the parent fires, when the timeout elapses, or when cancel()
// is called on it directly. The timeout is a deadline, not a timer, so
// nothing outlives the source.
class CancellationSource {
public:
    CancellationSource();

    static CancellationSource linked(const CancellationToken& parent,
                                     std::chrono::milliseconds timeout);

    void cancel();

    // Disarm the timeout (e.g. once a stream is open). External cancellation
    // still propagates.
    void clear_deadline();

    bool is_cancelled() const { return token().is_cancelled(); }
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace junkrat
