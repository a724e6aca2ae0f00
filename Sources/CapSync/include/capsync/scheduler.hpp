#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <vector>
#include <condition_variable>
#include <atomic>
#include <chrono>

namespace capsync {

// ============================================================================
// Scheduler interface - the event loop every completion is delivered on
// ============================================================================
//
// The library is single-threaded per client: downloads, lock requests, channel
// frames and retry timers all complete by posting work to one scheduler, so
// registry state is only touched from that context.
// - Host UI loops: wrap the loop's post/timer API
// - Tests: manual_scheduler (virtual clock)
// - Daemons: std_thread_scheduler

struct scheduler {
    using duration = std::chrono::milliseconds;

    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Invoke after at least `delay` has elapsed.
    virtual void invoke_after(duration delay, std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // False when invoke_after() ignores its delay. Periodic work is skipped
    // on such schedulers.
    [[nodiscard]] virtual bool honors_delays() const noexcept { return true; }
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================
//
// Delays are ignored: retries run back to back and heartbeats are off.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    void invoke_after(duration, std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool honors_delays() const noexcept override {
        return false;
    }
};

// ============================================================================
// std_thread_scheduler - runs callbacks on a dedicated worker thread
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler();
    ~std_thread_scheduler() override;

    std_thread_scheduler(const std_thread_scheduler&) = delete;
    std_thread_scheduler& operator=(const std_thread_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override;
    void invoke_after(duration delay, std::function<void()>&& fn) override;

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

private:
    using clock = std::chrono::steady_clock;

    struct timed_task {
        clock::time_point due;
        uint64_t order;
        std::function<void()> fn;

        bool operator>(const timed_task& other) const {
            return due > other.due || (due == other.due && order > other.order);
        }
    };

    void run_loop();

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<timed_task, std::vector<timed_task>, std::greater<timed_task>> queue_;
    uint64_t next_order_ = 0;
    std::atomic<bool> running_;
};

// ============================================================================
// Manual scheduler - virtual clock, drained explicitly by the host
// ============================================================================
//
// Nothing runs until run_pending() / advance() is called from the owning
// thread; draining from any other thread throws std::logic_error. Timers
// fire in due order as the virtual clock advances.

class manual_scheduler : public scheduler {
public:
    manual_scheduler() : owner_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override;
    void invoke_after(duration delay, std::function<void()>&& fn) override;

    /// Run every task due at the current virtual time, including tasks those
    /// tasks post. Returns the number of tasks run.
    size_t run_pending();

    /// Move the virtual clock forward, firing timers in due order.
    size_t advance(duration by);

    duration now() const { return now_; }
    size_t pending() const;

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == owner_;
    }

private:
    struct timed_task {
        duration due;
        uint64_t order;
        std::function<void()> fn;
    };

    bool pop_due(duration limit, timed_task& out);
    void require_owner() const;

    std::thread::id owner_;
    mutable std::mutex mutex_;
    std::vector<timed_task> tasks_;
    uint64_t next_order_ = 0;
    duration now_{0};
};

} // namespace capsync
