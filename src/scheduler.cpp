#include "scheduler.hpp"
#include "fleet_log.hpp"
#include <exception>
#include <utility>

namespace fleetdeck {

// =============================================================================
// PumpedFrameScheduler
// =============================================================================

FrameHandle PumpedFrameScheduler::requestFrame(std::function<void()> cb) {
    FrameHandle h = next_handle_++;
    callbacks_[h] = std::move(cb);
    return h;
}

void PumpedFrameScheduler::cancelFrame(FrameHandle handle) {
    callbacks_.erase(handle);
}

size_t PumpedFrameScheduler::runFrame() {
    auto batch = std::move(callbacks_);
    callbacks_.clear();
    for (auto& [handle, cb] : batch) {
        if (cb) cb();
    }
    return batch.size();
}

// =============================================================================
// TimerQueue
// =============================================================================

TimerQueue::TimerQueue() : TimerQueue([] { return Clock::now(); }) {}

TimerQueue::TimerQueue(NowFn now) : now_(std::move(now)) {}

TaskId TimerQueue::add(std::chrono::milliseconds delay, std::chrono::milliseconds period,
                       std::function<void()> fn) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = next_id_++;
        Task t;
        t.due = now_() + delay;
        t.period = period;
        t.fn = std::move(fn);
        tasks_.emplace(id, std::move(t));
        wake_seq_++;
    }
    cv_.notify_one();
    return id;
}

TaskId TimerQueue::postDelayed(std::chrono::milliseconds delay, std::function<void()> fn) {
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    return add(delay, std::chrono::milliseconds(0), std::move(fn));
}

TaskId TimerQueue::postEvery(std::chrono::milliseconds period, std::function<void()> fn) {
    if (period.count() < 1) period = std::chrono::milliseconds(1);
    return add(period, period, std::move(fn));
}

void TimerQueue::cancel(TaskId id) {
    if (id == NO_TASK) return;
    std::lock_guard<std::mutex> lock(mtx_);
    tasks_.erase(id);
}

size_t TimerQueue::runDue() {
    size_t ran = 0;
    Clock::time_point now;
    TaskId id_limit;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        now = now_();
        id_limit = next_id_;
    }

    for (;;) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto pick = tasks_.end();
            for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                if (it->first >= id_limit || it->second.due > now) continue;
                if (pick == tasks_.end() || it->second.due < pick->second.due) pick = it;
            }
            if (pick == tasks_.end()) break;

            Task& task = pick->second;
            if (task.period.count() > 0) {
                fn = task.fn;
                task.due += task.period;
                if (task.due <= now) task.due = now + task.period;  // skip missed ticks
            } else {
                fn = std::move(task.fn);
                tasks_.erase(pick);
            }
        }

        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            FLOG_ERROR("timer", "Task threw: %s", e.what());
        }
        ran++;
    }
    return ran;
}

std::optional<TimerQueue::Clock::time_point> TimerQueue::nextDeadline() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::optional<Clock::time_point> best;
    for (const auto& [id, task] : tasks_) {
        if (!best || task.due < *best) best = task.due;
    }
    return best;
}

size_t TimerQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size();
}

void TimerQueue::waitForWork(std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> lock(mtx_);
    auto now = now_();
    auto until = now + max_wait;
    for (const auto& [id, task] : tasks_) {
        if (task.due < until) until = task.due;
    }
    if (until <= now) return;
    const uint64_t seq = wake_seq_;
    cv_.wait_for(lock, until - now, [&] { return wake_seq_ != seq; });
}

void TimerQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        wake_seq_++;
    }
    cv_.notify_one();
}

// =============================================================================
// TimedFrameScheduler
// =============================================================================

TimedFrameScheduler::TimedFrameScheduler(TaskScheduler& tasks, std::chrono::milliseconds interval)
    : tasks_(tasks), interval_(interval) {}

TimedFrameScheduler::~TimedFrameScheduler() {
    tasks_.cancel(tick_);
}

FrameHandle TimedFrameScheduler::requestFrame(std::function<void()> cb) {
    FrameHandle h = next_handle_++;
    callbacks_[h] = std::move(cb);
    if (tick_ == NO_TASK) {
        tick_ = tasks_.postDelayed(interval_, [this] { onTick(); });
    }
    return h;
}

void TimedFrameScheduler::cancelFrame(FrameHandle handle) {
    callbacks_.erase(handle);
    if (callbacks_.empty() && tick_ != NO_TASK) {
        tasks_.cancel(tick_);
        tick_ = NO_TASK;
    }
}

void TimedFrameScheduler::onTick() {
    tick_ = NO_TASK;
    auto batch = std::move(callbacks_);
    callbacks_.clear();
    for (auto& [handle, cb] : batch) {
        if (cb) cb();
    }
}

} // namespace fleetdeck
