#pragma once

// ============================================================
// event_loop.hpp -- Single-threaded task executor with timers
//
// All session, negotiation and transfer state is touched only from
// tasks run by one Executor. Socket readers and other background
// threads hand work over with post(); deferred retries (backpressure,
// inter-file delay, relay reconnect) use post_delayed().
// ============================================================

#include "platform.hpp"
#include "logger.hpp"
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <type_traits>

using Task = std::function<void()>;

class Executor {
public:
    virtual ~Executor() = default;

    // Run 'task' after every task posted before it
    virtual void post(Task task) = 0;

    // Run 'task' no earlier than delay_ms from now
    virtual void post_delayed(u32 delay_ms, Task task) = 0;
};

class EventLoop : public Executor {
public:
    EventLoop() {
        worker_ = std::thread([this] { run(); });
    }

    ~EventLoop() override {
        stop();
    }

    void post(Task task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) return;
            ready_.push(std::move(task));
        }
        cv_.notify_one();
    }

    void post_delayed(u32 delay_ms, Task task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) return;
            timers_.push(Timer{Clock::now() + std::chrono::milliseconds(delay_ms),
                               next_seq_++, std::move(task)});
        }
        cv_.notify_one();
    }

    // Run a callable on the loop and wait for its result.
    // Must not be called from the loop thread itself.
    template<typename F>
    auto call(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using RetType = typename std::invoke_result<F>::type;
        if (in_loop_thread()) {
            throw std::logic_error("EventLoop::call from the loop thread would deadlock");
        }
        auto task = std::make_shared<std::packaged_task<RetType()>>(std::forward<F>(f));
        std::future<RetType> res = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("EventLoop is stopped");
            ready_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return res;
    }

    bool in_loop_thread() const {
        return std::this_thread::get_id() == worker_.get_id();
    }

    // Drop pending timers, finish the task in progress, join the worker
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) return;
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            if (in_loop_thread()) {
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

    // Non-copyable, non-movable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        u64               seq;
        Task              task;
    };
    // Earliest due first; equal deadlines keep posting order
    struct Later {
        bool operator()(const Timer& a, const Timer& b) const {
            if (a.due != b.due) return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    void run() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                for (;;) {
                    if (stop_) return;
                    auto now = Clock::now();
                    // Promote due timers into the ready queue
                    while (!timers_.empty() && timers_.top().due <= now) {
                        ready_.push(std::move(const_cast<Timer&>(timers_.top()).task));
                        timers_.pop();
                    }
                    if (!ready_.empty()) break;
                    if (timers_.empty()) {
                        cv_.wait(lock);
                    } else {
                        cv_.wait_until(lock, timers_.top().due);
                    }
                }
                task = std::move(ready_.front());
                ready_.pop();
            }
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Unhandled error in event loop task: ") + e.what());
            }
        }
    }

    std::thread                                          worker_;
    std::queue<Task>                                     ready_;
    std::priority_queue<Timer, std::vector<Timer>, Later> timers_;
    std::mutex                                           mutex_;
    std::condition_variable                              cv_;
    u64                                                  next_seq_{0};
    bool                                                 stop_{false};
};
