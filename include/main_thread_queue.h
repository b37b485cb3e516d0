// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main_thread_queue.h
 * @brief Thread-safe hand-off of work to the main (UI-owning) thread
 *
 * Only the main thread may touch the view or show dialogs. Other threads
 * (the update scheduler, the single-instance listener) hand work over:
 *
 * @code
 * // Fire and forget
 * queue.post([&view] { view.focus(); });
 *
 * // Request/response: the background task blocks until the main thread answers
 * bool accepted = queue.call_sync([&] { return dialogs.show_message(...); });
 * @endcode
 *
 * The main thread drains the queue in run_until(), which is the
 * application's main loop.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace hackerai {

class MainThreadQueue {
  public:
    using Task = std::function<void()>;

    MainThreadQueue() : main_thread_id_(std::this_thread::get_id()) {}

    // Non-copyable
    MainThreadQueue(const MainThreadQueue&) = delete;
    MainThreadQueue& operator=(const MainThreadQueue&) = delete;

    /** @brief Re-bind the owning thread (call from the thread that will drain) */
    void bind_to_current_thread() {
        main_thread_id_ = std::this_thread::get_id();
    }

    bool is_main_thread() const {
        return std::this_thread::get_id() == main_thread_id_;
    }

    /**
     * @brief Queue a task for the main thread
     *
     * Thread-safe. Tasks posted after shutdown() are dropped.
     */
    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) {
                spdlog::debug("[MainThreadQueue] Dropping task posted after shutdown");
                return;
            }
            pending_.push_back(std::move(task));
        }
        cv_.notify_all();
    }

    /**
     * @brief Run a function on the main thread and wait for its result
     *
     * Runs inline when called from the main thread. Exceptions thrown by fn
     * are rethrown in the caller. If the queue shuts down before fn runs,
     * std::future_error (broken_promise) is thrown.
     */
    template <typename Fn> auto call_sync(Fn fn) -> std::invoke_result_t<Fn> {
        using R = std::invoke_result_t<Fn>;
        if (is_main_thread()) {
            return fn();
        }

        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        post([task] { (*task)(); });
        return result.get();
    }

    /**
     * @brief Run all currently queued tasks
     * @return Number of tasks executed
     */
    size_t process_pending() {
        std::deque<Task> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(pending_);
        }
        for (auto& task : batch) {
            task();
        }
        return batch.size();
    }

    /**
     * @brief Main loop: drain tasks until quit() returns true
     *
     * Wakes at least every poll interval to re-evaluate quit().
     */
    template <typename Pred>
    void run_until(Pred quit,
                   std::chrono::milliseconds poll = std::chrono::milliseconds(100)) {
        while (!quit()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, poll, [this] { return !pending_.empty() || shut_down_; });
            }
            process_pending();
        }
    }

    /**
     * @brief Stop accepting tasks and drop the ones not yet run
     *
     * Dropping destroys pending call_sync() tasks, which releases their
     * waiting callers with a broken_promise error instead of a deadlock.
     */
    void shutdown() {
        std::deque<Task> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shut_down_ = true;
            dropped.swap(pending_);
        }
        cv_.notify_all();
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

  private:
    std::thread::id main_thread_id_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> pending_;
    bool shut_down_ = false;
};

} // namespace hackerai
