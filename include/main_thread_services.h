// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file main_thread_services.h
 * @brief Host-service decorators that marshal calls onto the main thread
 *
 * The update scheduler calls IDialogService from its own thread. Wrapping the
 * real service in MainThreadDialogService turns each prompt into a
 * synchronous request to the main thread: the background task blocks until
 * the user answers and then continues with the result.
 */

#include "host_services.h"
#include "main_thread_queue.h"

#include <spdlog/spdlog.h>

#include <future>

namespace hackerai {

class MainThreadDialogService : public IDialogService {
  public:
    MainThreadDialogService(IDialogService& inner, MainThreadQueue& queue)
        : inner_(inner), queue_(queue) {}

    bool show_message(const std::string& title, const std::string& message, MessageKind kind,
                      const DialogButtons& buttons) override {
        try {
            return queue_.call_sync(
                [&] { return inner_.show_message(title, message, kind, buttons); });
        } catch (const std::future_error& e) {
            // Main loop went away before the dialog ran (shutdown)
            spdlog::debug("[MainThreadDialogService] Dialog '{}' dropped: {}", title, e.what());
            return false;
        }
    }

  private:
    IDialogService& inner_;
    MainThreadQueue& queue_;
};

class MainThreadWebView : public IWebView {
  public:
    MainThreadWebView(IWebView& inner, MainThreadQueue& queue) : inner_(inner), queue_(queue) {}

    bool navigate(const std::string& url, std::string& error) override {
        try {
            return queue_.call_sync([&] { return inner_.navigate(url, error); });
        } catch (const std::future_error& e) {
            error = std::string("main loop unavailable: ") + e.what();
            return false;
        }
    }

    void focus() override {
        queue_.post([this] { inner_.focus(); });
    }

  private:
    IWebView& inner_;
    MainThreadQueue& queue_;
};

} // namespace hackerai
