#include "scheduler.hpp"
#include <algorithm>
#include <iostream>

namespace junkrat {

TimerThread::TimerThread() {
    thread_ = std::thread([this]() { run(); });
}

TimerThread::~TimerThread() {
    stop();
}

TimerId TimerThread::schedule_after(std::chrono::milliseconds delay,
                                    std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    if (stopping_) return id;
    timers_.emplace(id, Timer{Clock::now() + std::max(delay, std::chrono::milliseconds(0)),
                              std::move(task)});
    cv_.notify_all();
    return id;
}

bool TimerThread::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = timers_.erase(id) > 0;
    if (removed) cv_.notify_all();
    return removed;
}

void TimerThread::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

size_t TimerThread::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerThread::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }

        // Earliest due; ties go to the earlier id
        auto next = std::min_element(timers_.begin(), timers_.end(),
                                     [](const auto& a, const auto& b) {
                                         return a.second.due < b.second.due;
                                     });
        Clock::time_point due = next->second.due; // the entry may go while we wait
        if (Clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        auto task = std::move(next->second.task);
        timers_.erase(next);
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[timer] Task failed: " << e.what() << '\n';
        }
        lock.lock();
    }
}

} // namespace junkrat
