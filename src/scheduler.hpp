// =============================================================================
// FleetDeck - Scheduling primitives
// =============================================================================
// FrameScheduler: per-frame ("next tick") callbacks, one batch per frame.
// TaskScheduler:  delayed / periodic tasks, executed on the console loop.
//
// All engine components run on the single console-loop thread. Transport
// threads never touch engine state directly: they post() onto the loop.
// =============================================================================
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace fleetdeck {

using FrameHandle = uint64_t;
using TaskId = uint64_t;
inline constexpr FrameHandle NO_FRAME = 0;
inline constexpr TaskId NO_TASK = 0;

class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    // Runs `cb` once at the next frame. Never returns NO_FRAME.
    virtual FrameHandle requestFrame(std::function<void()> cb) = 0;
    virtual void cancelFrame(FrameHandle handle) = 0;
};

class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    virtual TaskId postDelayed(std::chrono::milliseconds delay, std::function<void()> fn) = 0;
    virtual TaskId postEvery(std::chrono::milliseconds period, std::function<void()> fn) = 0;
    virtual void cancel(TaskId id) = 0;

    TaskId post(std::function<void()> fn) {
        return postDelayed(std::chrono::milliseconds(0), std::move(fn));
    }
};

// Frame scheduler driven by the host's render loop: runFrame() once per
// displayed frame. Callbacks requested during a frame run on the next one.
class PumpedFrameScheduler : public FrameScheduler {
public:
    FrameHandle requestFrame(std::function<void()> cb) override;
    void cancelFrame(FrameHandle handle) override;

    // Returns number of callbacks run
    size_t runFrame();
    size_t pending() const { return callbacks_.size(); }

private:
    std::map<FrameHandle, std::function<void()>> callbacks_;
    FrameHandle next_handle_ = 1;
};

// Thread-safe timer queue. Any thread may post; tasks run on the thread that
// calls runDue(). The clock is injectable so tests can drive time manually.
class TimerQueue : public TaskScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    TimerQueue();
    explicit TimerQueue(NowFn now);

    TaskId postDelayed(std::chrono::milliseconds delay, std::function<void()> fn) override;
    TaskId postEvery(std::chrono::milliseconds period, std::function<void()> fn) override;
    void cancel(TaskId id) override;

    // Runs every task due at call time; each periodic task at most once.
    size_t runDue();

    std::optional<Clock::time_point> nextDeadline() const;
    size_t size() const;

    // Blocks until a task may be due, a post() arrives, wake() is called or
    // `max_wait` elapses. Uses the real clock.
    void waitForWork(std::chrono::milliseconds max_wait);
    void wake();

private:
    struct Task {
        Clock::time_point due;
        std::chrono::milliseconds period{0};   // 0 = one-shot
        std::function<void()> fn;
    };

    TaskId add(std::chrono::milliseconds delay, std::chrono::milliseconds period,
               std::function<void()> fn);

    NowFn now_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<TaskId, Task> tasks_;
    TaskId next_id_ = 1;
    uint64_t wake_seq_ = 0;
};

// FrameScheduler ticking at a fixed interval on a TaskScheduler, for hosts
// without a render loop (headless console).
class TimedFrameScheduler : public FrameScheduler {
public:
    TimedFrameScheduler(TaskScheduler& tasks, std::chrono::milliseconds interval);
    ~TimedFrameScheduler() override;

    FrameHandle requestFrame(std::function<void()> cb) override;
    void cancelFrame(FrameHandle handle) override;

private:
    void onTick();

    TaskScheduler& tasks_;
    std::chrono::milliseconds interval_;
    std::map<FrameHandle, std::function<void()>> callbacks_;
    FrameHandle next_handle_ = 1;
    TaskId tick_ = NO_TASK;
};

} // namespace fleetdeck
