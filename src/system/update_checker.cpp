// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/update_checker.h"

#include "spdlog/spdlog.h"

namespace hackerai {

const char* check_outcome_name(CheckOutcome outcome) {
    switch (outcome) {
    case CheckOutcome::UpdateServiceError:
        return "update_service_error";
    case CheckOutcome::UpToDate:
        return "up_to_date";
    case CheckOutcome::UserDeclined:
        return "user_declined";
    case CheckOutcome::InstallFailure:
        return "install_failure";
    case CheckOutcome::InstalledRestartDeferred:
        return "installed_restart_deferred";
    case CheckOutcome::InstalledRestarting:
        return "installed_restarting";
    }
    return "unknown";
}

UpdateChecker::UpdateChecker(IUpdateService& service, IDialogService& dialogs, IAppControl& app)
    : service_(service), dialogs_(dialogs), app_(app) {}

void UpdateChecker::show_error(const std::string& message) {
    dialogs_.show_message("Update Error", message, MessageKind::Error, DialogButtons::ok());
}

CheckOutcome UpdateChecker::check_for_updates(bool silent) {
    std::lock_guard<std::mutex> lock(check_mutex_);

    spdlog::debug("[UpdateChecker] Checking for updates ({})", silent ? "silent" : "interactive");
    UpdateCheckResult result = service_.check();

    if (!result.ok()) {
        if (silent) {
            spdlog::warn("[UpdateChecker] Auto-update check failed: {}", result.error);
        } else {
            spdlog::error("[UpdateChecker] Failed to check for updates: {}", result.error);
            show_error("Failed to check for updates: " + result.error);
        }
        return CheckOutcome::UpdateServiceError;
    }

    if (!result.update) {
        if (silent) {
            spdlog::info("[UpdateChecker] No updates available (auto-check)");
        } else {
            spdlog::info("[UpdateChecker] No updates available");
            dialogs_.show_message("No Updates", "You're running the latest version.",
                                  MessageKind::Info, DialogButtons::ok());
        }
        return CheckOutcome::UpToDate;
    }

    const UpdateInfo& update = *result.update;
    spdlog::info("[UpdateChecker] Update available: {}", update.version);

    bool should_update = dialogs_.show_message(
        "Update Available",
        "A new version (" + update.version + ") is available. Would you like to update now?",
        MessageKind::Info, DialogButtons::ok_cancel());

    if (!should_update) {
        spdlog::info("[UpdateChecker] User declined update to version {}", update.version);
        return CheckOutcome::UserDeclined;
    }

    spdlog::info("[UpdateChecker] User accepted update to version {}", update.version);

    int last_logged_percent = -10;
    std::string install_error =
        service_.download_and_install(update, [&last_logged_percent](size_t received, size_t total) {
            if (total == 0) {
                return;
            }
            int percent = static_cast<int>((100 * received) / total);
            if (percent - last_logged_percent >= 10 || percent == 100) {
                last_logged_percent = percent;
                spdlog::debug("[UpdateChecker] Download {}% ({}/{} bytes)", percent, received,
                              total);
            }
        });

    if (!install_error.empty()) {
        spdlog::error("[UpdateChecker] Failed to install update: {}", install_error);
        show_error("Failed to install update: " + install_error);
        return CheckOutcome::InstallFailure;
    }

    spdlog::info("[UpdateChecker] Update installed successfully");

    bool restart_now = dialogs_.show_message(
        "Update Complete", "Update installed successfully. Restart now to apply changes?",
        MessageKind::Info, DialogButtons::ok_cancel_custom("Restart Now", "Later"));

    if (!restart_now) {
        spdlog::info("[UpdateChecker] Restart deferred by user");
        return CheckOutcome::InstalledRestartDeferred;
    }

    spdlog::info("[UpdateChecker] Restarting to apply update");
    app_.restart();
    return CheckOutcome::InstalledRestarting;
}

} // namespace hackerai
