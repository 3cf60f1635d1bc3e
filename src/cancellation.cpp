#include "cancellation.hpp"
#include <algorithm>
#include <thread>

namespace junkrat {

namespace detail {

CancelReason CancelState::reason() const {
    if (cancelled.load(std::memory_order_acquire)) return CancelReason::Cancelled;
    if (parent) {
        CancelReason r = parent->reason();
        if (r != CancelReason::None) return r;
    }
    auto d = deadline();
    if (d && std::chrono::steady_clock::now() >= *d)
        return CancelReason::TimedOut;
    return CancelReason::None;
}

std::optional<std::chrono::steady_clock::time_point> CancelState::deadline() const {
    int64_t ns = deadline_ns.load(std::memory_order_acquire);
    if (ns == kNoDeadline) return std::nullopt;
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::nanoseconds(ns)));
}

// Wake every waiter on `state` and its descendants.
static void notify_tree(const std::shared_ptr<CancelState>& state) {
    std::vector<std::shared_ptr<CancelState>> live;
    {
        // Taking this lock orders the notify after any waiter's predicate check
        std::lock_guard<std::mutex> lock(state->mutex);
        for (const auto& weak : state->children) {
            if (auto child = weak.lock()) live.push_back(std::move(child));
        }
    }
    state->cv.notify_all();
    for (const auto& child : live) notify_tree(child);
}

} // namespace detail

// ── CancellationToken ─────────────────────────────────────────

CancelReason CancellationToken::reason() const {
    if (!state_) return CancelReason::None;
    return state_->reason();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }

    auto wake = std::chrono::steady_clock::now() + duration;
    if (auto left = remaining()) {
        // A deadline does not notify the condition variable; wake for it.
        wake = std::min(wake, std::chrono::steady_clock::now() + *left);
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_until(lock, wake, [this] { return is_cancelled(); });
    return is_cancelled();
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    std::optional<std::chrono::steady_clock::time_point> earliest;
    for (auto* s = state_.get(); s; s = s->parent.get()) {
        auto d = s->deadline();
        if (d && (!earliest || *d < *earliest)) earliest = d;
    }
    if (!earliest) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *earliest - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

// ── CancellationSource ────────────────────────────────────────

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

CancellationSource CancellationSource::linked(const CancellationToken& parent,
                                              std::chrono::milliseconds timeout) {
    CancellationSource source;
    if (timeout.count() > 0) {
        auto at = std::chrono::steady_clock::now() + timeout;
        source.state_->deadline_ns.store(
            std::chrono::duration_cast<std::chrono::nanoseconds>(at.time_since_epoch()).count(),
            std::memory_order_release);
    }

    if (parent.state_) {
        source.state_->parent = parent.state_;
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        auto& kids = parent.state_->children;
        kids.erase(std::remove_if(kids.begin(), kids.end(),
                                  [](const std::weak_ptr<detail::CancelState>& w) {
                                      return w.expired();
                                  }),
                   kids.end());
        kids.push_back(source.state_);
    }
    return source;
}

void CancellationSource::cancel() {
    {
        // Set under the lock so a waiter cannot miss the transition
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true, std::memory_order_release);
    }
    detail::notify_tree(state_);
}

void CancellationSource::clear_deadline() {
    state_->deadline_ns.store(detail::CancelState::kNoDeadline, std::memory_order_release);
}

} // namespace junkrat
