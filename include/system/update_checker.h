// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file update_checker.h
 * @brief Update check/install flow shared by background and user-initiated checks
 *
 * Silent checks (background scheduler) only log failures and "no update".
 * Interactive checks report both through a blocking dialog. In both modes a
 * found update is offered to the user, installed only after confirmation,
 * and followed by a restart prompt; restart happens only on "Restart Now".
 *
 * SAFETY: Errors are reported, never thrown. A failed install is not retried.
 */

#pragma once

#include "host_services.h"
#include "system/update_service.h"

#include <mutex>

namespace hackerai {

enum class CheckOutcome {
    UpdateServiceError,       ///< Check failed (network, server, manifest)
    UpToDate,                 ///< No newer release
    UserDeclined,             ///< Update offered, user chose Cancel
    InstallFailure,           ///< download_and_install() failed
    InstalledRestartDeferred, ///< Installed, user chose "Later"
    InstalledRestarting       ///< Installed, restart requested
};

const char* check_outcome_name(CheckOutcome outcome);

class UpdateChecker {
  public:
    /**
     * @param service Update backend
     * @param dialogs Dialog service (must be safe to call from the checking thread)
     * @param app Restart primitive
     */
    UpdateChecker(IUpdateService& service, IDialogService& dialogs, IAppControl& app);

    // Non-copyable
    UpdateChecker(const UpdateChecker&) = delete;
    UpdateChecker& operator=(const UpdateChecker&) = delete;

    /**
     * @brief Run one update check
     *
     * Blocks the calling thread for the network request and any dialogs.
     * Concurrent calls are serialized so two prompts never stack.
     *
     * @param silent true for background checks
     */
    CheckOutcome check_for_updates(bool silent);

  private:
    void show_error(const std::string& message);

    IUpdateService& service_;
    IDialogService& dialogs_;
    IAppControl& app_;
    std::mutex check_mutex_;
};

} // namespace hackerai
