#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace junkrat {

using TimerId = uint64_t;

// One-shot delayed tasks. Implementations run tasks one at a time.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Run `task` once after `delay`. Never returns 0.
    virtual TimerId schedule_after(std::chrono::milliseconds delay,
                                   std::function<void()> task) = 0;

    // Returns true if the task was pending and will not run.
    virtual bool cancel(TimerId id) = 0;
};

// Scheduler backed by a single worker thread, the sole place timer
// callbacks run.
class TimerThread : public Scheduler {
public:
    TimerThread();
    ~TimerThread() override;

    TimerThread(const TimerThread&) = delete;
    TimerThread& operator=(const TimerThread&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay,
                           std::function<void()> task) override;
    bool cancel(TimerId id) override;

    // Drop pending tasks and join the worker. A task already running
    // completes first. Idempotent.
    void stop();

    size_t pending() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        std::function<void()> task;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace junkrat
