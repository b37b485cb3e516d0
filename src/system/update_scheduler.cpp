// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/update_scheduler.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace hackerai {

UpdateScheduler::UpdateScheduler(UpdateThrottle& throttle, CheckFn run_check,
                                 std::chrono::milliseconds poll_interval, ClockFn clock)
    : throttle_(throttle), run_check_(std::move(run_check)), poll_interval_(poll_interval),
      clock_(clock ? std::move(clock) : ClockFn(&UpdateThrottle::now_seconds)) {}

UpdateScheduler::~UpdateScheduler() {
    // NOTE: Don't use spdlog here - during exit(), spdlog may already be destroyed
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void UpdateScheduler::start(bool check_on_launch) {
    if (running_.load()) {
        return;
    }

    check_on_launch_ = check_on_launch;
    stop_requested_.store(false);
    running_.store(true);
    thread_ = std::thread(&UpdateScheduler::loop, this);
    spdlog::debug("[UpdateScheduler] Started (poll every {}s, check every {}s)",
                  std::chrono::duration_cast<std::chrono::seconds>(poll_interval_).count(),
                  throttle_.check_interval_sec());
}

void UpdateScheduler::stop() {
    if (!running_.load()) {
        return;
    }

    spdlog::debug("[UpdateScheduler] Stopping");

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_.store(true);
    }
    stop_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    running_.store(false);
    state_.store(State::Stopped);
}

bool UpdateScheduler::interruptible_sleep(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
}

void UpdateScheduler::run_cycle() {
    state_.store(State::Checking);
    throttle_.save(clock_());
    ++check_count_;

    try {
        run_check_();
    } catch (const std::exception& e) {
        // A failing check must never take the loop down
        spdlog::error("[UpdateScheduler] Update check threw: {}", e.what());
    }
}

void UpdateScheduler::loop() {
    if (check_on_launch_) {
        spdlog::info("[UpdateScheduler] Running update check on launch");
        run_cycle();
    } else {
        spdlog::debug("[UpdateScheduler] Launch check skipped, interactive check queued");
    }

    while (!stop_requested_.load()) {
        state_.store(State::IdleWaiting);
        if (!interruptible_sleep(poll_interval_)) {
            break;
        }

        if (throttle_.is_check_due(clock_())) {
            spdlog::info("[UpdateScheduler] Running scheduled update check ({}s interval)",
                         throttle_.check_interval_sec());
            run_cycle();
        } else {
            spdlog::trace("[UpdateScheduler] Update check not due yet");
        }
    }

    state_.store(State::Stopped);
}

} // namespace hackerai
