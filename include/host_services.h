// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file host_services.h
 * @brief Interfaces to the services the desktop host provides
 *
 * The deep-link handler and update flow only talk to these interfaces.
 * Linux implementations live in browser_view.h, zenity_dialog_service.h and
 * Application; tests substitute the mocks in tests/mocks/.
 */

#include <string>

namespace hackerai {

/**
 * @brief The embedded view showing the web app
 */
class IWebView {
  public:
    virtual ~IWebView() = default;

    /**
     * @brief Navigate to an absolute URL
     * @param url Absolute URL
     * @param error Output: reason on failure
     * @return true if navigation was started
     */
    virtual bool navigate(const std::string& url, std::string& error) = 0;

    /** @brief Bring the view to the foreground (best effort) */
    virtual void focus() = 0;
};

enum class MessageKind { Info, Warning, Error };

/**
 * @brief Button set for a message dialog
 *
 * Ok: single button. OkCancel: OK/Cancel. OkCancelCustom: two buttons with
 * custom labels; the first maps to "accepted".
 */
struct DialogButtons {
    enum class Type { Ok, OkCancel, OkCancelCustom };

    Type type = Type::Ok;
    std::string ok_label;
    std::string cancel_label;

    static DialogButtons ok() {
        return {};
    }
    static DialogButtons ok_cancel() {
        return {Type::OkCancel, "", ""};
    }
    static DialogButtons ok_cancel_custom(const std::string& ok, const std::string& cancel) {
        return {Type::OkCancelCustom, ok, cancel};
    }
};

/**
 * @brief Blocking message boxes
 */
class IDialogService {
  public:
    virtual ~IDialogService() = default;

    /**
     * @brief Show a modal message and wait for the user
     * @return true if the user accepted (OK / first custom button)
     */
    virtual bool show_message(const std::string& title, const std::string& message,
                              MessageKind kind, const DialogButtons& buttons) = 0;
};

/**
 * @brief Process-level controls
 */
class IAppControl {
  public:
    virtual ~IAppControl() = default;

    /** @brief Restart the application now */
    virtual void restart() = 0;
};

} // namespace hackerai
