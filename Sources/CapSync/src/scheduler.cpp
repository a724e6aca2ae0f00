#include "capsync/scheduler.hpp"
#include <algorithm>
#include <stdexcept>

namespace capsync {

// ============================================================================
// std_thread_scheduler
// ============================================================================

std_thread_scheduler::std_thread_scheduler() : running_(true) {
    worker_ = std::thread([this] { run_loop(); });
    thread_id_ = worker_.get_id();
}

std_thread_scheduler::~std_thread_scheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void std_thread_scheduler::invoke(std::function<void()>&& fn) {
    invoke_after(duration::zero(), std::move(fn));
}

void std_thread_scheduler::invoke_after(duration delay, std::function<void()>&& fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        queue_.push({clock::now() + delay, next_order_++, std::move(fn)});
    }
    cv_.notify_one();
}

void std_thread_scheduler::run_loop() {
    while (true) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (!running_) {
                    return;
                }
                if (queue_.empty()) {
                    cv_.wait(lock);
                    continue;
                }
                auto due = queue_.top().due;
                if (due <= clock::now()) {
                    break;
                }
                cv_.wait_until(lock, due);
            }
            fn = std::move(const_cast<timed_task&>(queue_.top()).fn);
            queue_.pop();
        }

        if (fn) {
            fn();
        }
    }
}

// ============================================================================
// manual_scheduler
// ============================================================================

void manual_scheduler::invoke(std::function<void()>&& fn) {
    invoke_after(duration::zero(), std::move(fn));
}

void manual_scheduler::invoke_after(duration delay, std::function<void()>&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back({now_ + delay, next_order_++, std::move(fn)});
}

size_t manual_scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool manual_scheduler::pop_due(duration limit, timed_task& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::min_element(tasks_.begin(), tasks_.end(),
        [](const timed_task& a, const timed_task& b) {
            return a.due < b.due || (a.due == b.due && a.order < b.order);
        });
    if (it == tasks_.end() || it->due > limit) {
        return false;
    }
    out = std::move(*it);
    tasks_.erase(it);
    return true;
}

void manual_scheduler::require_owner() const {
    if (!is_on_thread()) {
        throw std::logic_error("manual_scheduler must be drained on the thread that created it");
    }
}

size_t manual_scheduler::run_pending() {
    require_owner();
    size_t count = 0;
    timed_task task;
    while (pop_due(now_, task)) {
        if (task.fn) task.fn();
        ++count;
    }
    return count;
}

size_t manual_scheduler::advance(duration by) {
    require_owner();
    const duration target = now_ + by;
    size_t count = 0;
    timed_task task;
    while (pop_due(target, task)) {
        if (task.due > now_) {
            now_ = task.due;
        }
        if (task.fn) task.fn();
        ++count;
    }
    now_ = target;
    return count;
}

} // namespace capsync
