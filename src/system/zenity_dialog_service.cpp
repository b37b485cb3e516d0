// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/zenity_dialog_service.h"

#include "utils/process_exec.h"

#include <spdlog/spdlog.h>

namespace hackerai {

namespace {

const char* kind_flag(MessageKind kind) {
    switch (kind) {
    case MessageKind::Warning:
        return "--warning";
    case MessageKind::Error:
        return "--error";
    case MessageKind::Info:
    default:
        return "--info";
    }
}

const char* kind_icon(MessageKind kind) {
    switch (kind) {
    case MessageKind::Warning:
        return "dialog-warning";
    case MessageKind::Error:
        return "dialog-error";
    case MessageKind::Info:
    default:
        return "dialog-information";
    }
}

} // namespace

ZenityDialogService::ZenityDialogService(std::string program) : program_(std::move(program)) {}

std::vector<std::string> ZenityDialogService::build_args(const std::string& title,
                                                         const std::string& message,
                                                         MessageKind kind,
                                                         const DialogButtons& buttons) const {
    std::vector<std::string> args{resolve_tool(program_)};

    if (buttons.type == DialogButtons::Type::Ok) {
        args.emplace_back(kind_flag(kind));
    } else {
        args.emplace_back("--question");
        args.emplace_back(std::string("--icon-name=") + kind_icon(kind));
    }

    args.emplace_back("--title=" + title);
    args.emplace_back("--text=" + message);
    args.emplace_back("--no-markup");

    switch (buttons.type) {
    case DialogButtons::Type::Ok:
        break;
    case DialogButtons::Type::OkCancel:
        args.emplace_back("--ok-label=OK");
        args.emplace_back("--cancel-label=Cancel");
        break;
    case DialogButtons::Type::OkCancelCustom:
        args.emplace_back("--ok-label=" + buttons.ok_label);
        args.emplace_back("--cancel-label=" + buttons.cancel_label);
        break;
    }

    return args;
}

bool ZenityDialogService::show_message(const std::string& title, const std::string& message,
                                       MessageKind kind, const DialogButtons& buttons) {
    spdlog::debug("[ZenityDialogService] Showing '{}'", title);

    int rc = safe_exec(build_args(title, message, kind, buttons), true);
    if (rc < 0 || rc > 1) {
        // 127: not installed, 5: timeout, -1: could not run
        spdlog::error("[ZenityDialogService] Dialog '{}' could not be shown (exit {}): {}", title,
                      rc, message);
        return false;
    }

    bool accepted = rc == 0;
    spdlog::debug("[ZenityDialogService] '{}' answered: {}", title,
                  accepted ? "accepted" : "dismissed");
    return accepted;
}

} // namespace hackerai
