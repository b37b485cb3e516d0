// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_HOST_SERVICES_H
#define MOCK_HOST_SERVICES_H

/**
 * @file mock_host_services.h
 * @brief Scriptable host services for deep-link and update flow tests
 *
 * None of these touch the desktop: navigation, dialogs and restarts are
 * recorded so tests can assert on exactly what the user would have seen.
 *
 * @example
 * MockDialogService dialogs;
 * dialogs.answers = {true, false}; // accept update, then "Later"
 * UpdateChecker checker(service, dialogs, app);
 */

#include "host_services.h"
#include "system/update_service.h"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

using namespace hackerai;

/**
 * @brief Web view that records navigations
 *
 * fail_first_n makes the first N navigate() calls fail with failure_message.
 */
class MockWebView : public IWebView {
  public:
    bool navigate(const std::string& url, std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        attempted_urls.push_back(url);
        if (fail_first_n > 0) {
            --fail_first_n;
            error = failure_message;
            return false;
        }
        navigated_urls.push_back(url);
        return true;
    }

    void focus() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++focus_count;
    }

    std::vector<std::string> attempted_urls;
    std::vector<std::string> navigated_urls;
    int fail_first_n = 0;
    std::string failure_message = "view closed";
    int focus_count = 0;

  private:
    std::mutex mutex_;
};

/**
 * @brief Dialog service with scripted answers
 *
 * Each show_message() pops the next answer; once the script runs out every
 * dialog is dismissed (returns false).
 */
class MockDialogService : public IDialogService {
  public:
    struct Shown {
        std::string title;
        std::string message;
        MessageKind kind;
        DialogButtons buttons;
    };

    bool show_message(const std::string& title, const std::string& message, MessageKind kind,
                      const DialogButtons& buttons) override {
        std::lock_guard<std::mutex> lock(mutex_);
        shown.push_back({title, message, kind, buttons});
        if (answers.empty()) {
            return false;
        }
        bool answer = answers.front();
        answers.pop_front();
        return answer;
    }

    std::vector<std::string> titles() const {
        std::vector<std::string> out;
        for (const auto& s : shown) {
            out.push_back(s.title);
        }
        return out;
    }

    std::deque<bool> answers;
    std::vector<Shown> shown;

  private:
    std::mutex mutex_;
};

class MockAppControl : public IAppControl {
  public:
    void restart() override {
        ++restart_count;
    }

    int restart_count = 0;
};

/**
 * @brief Update backend returning a canned check result
 */
class MockUpdateService : public IUpdateService {
  public:
    UpdateCheckResult check() override {
        ++check_count;
        return check_result;
    }

    std::string download_and_install(const UpdateInfo& info,
                                     DownloadProgressCallback progress) override {
        ++install_count;
        installed_version = info.version;
        if (progress) {
            progress(512, 1024);
            progress(1024, 1024);
        }
        return install_error;
    }

    void set_update_available(const std::string& version) {
        UpdateInfo info;
        info.version = version;
        info.current_version = "1.0.0";
        info.download_url = "https://downloads.example.com/HackerAI-" + version + ".AppImage";
        check_result = {};
        check_result.update = info;
    }

    UpdateCheckResult check_result;
    std::string install_error;
    std::string installed_version;
    int check_count = 0;
    int install_count = 0;
};

#endif // MOCK_HOST_SERVICES_H
