// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file update_scheduler.h
 * @brief Background update-check loop
 *
 * One thread for the life of the process:
 *
 *   CHECKING      save timestamp, run a silent check, wait for it
 *   IDLE-WAITING  sleep poll_interval, then check again if the throttle
 *                 says 24h have passed (or the timestamp is unreadable)
 *
 * The first cycle always checks unless start(false) is used because an
 * interactive check is already queued for this launch. stop() exists for
 * process shutdown only.
 */

#include "system/update_throttle.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace hackerai {

class UpdateScheduler {
  public:
    enum class State { Stopped, Checking, IdleWaiting };

    using CheckFn = std::function<void()>;
    using ClockFn = std::function<uint64_t()>;

    static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{60 * 60 * 1000};

    /**
     * @param throttle Timestamp store (must outlive the scheduler)
     * @param run_check Silent update check; blocks until finished
     * @param poll_interval Sleep between throttle decisions
     * @param clock POSIX seconds source (defaults to the system clock)
     */
    UpdateScheduler(UpdateThrottle& throttle, CheckFn run_check,
                    std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL,
                    ClockFn clock = nullptr);
    ~UpdateScheduler();

    // Non-copyable
    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;

    /**
     * @brief Spawn the loop thread. Idempotent.
     * @param check_on_launch Run the first cycle immediately; when false the
     *        loop starts in IDLE-WAITING and the throttle decides
     */
    void start(bool check_on_launch = true);

    /** @brief Interrupt the sleep and join the thread. Idempotent. */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    State state() const {
        return state_.load();
    }

    /** @brief Number of checks run so far */
    int check_count() const {
        return check_count_.load();
    }

  private:
    void loop();
    void run_cycle();

    /// @return false if stop was requested during the sleep
    bool interruptible_sleep(std::chrono::milliseconds duration);

    UpdateThrottle& throttle_;
    CheckFn run_check_;
    std::chrono::milliseconds poll_interval_;
    ClockFn clock_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    bool check_on_launch_ = true;
    std::atomic<State> state_{State::Stopped};
    std::atomic<int> check_count_{0};

    std::condition_variable stop_cv_; ///< For interruptible sleep
    std::mutex stop_mutex_;           ///< Protects stop_cv_ wait
};

} // namespace hackerai
