// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "host_services.h"

#include <string>
#include <vector>

namespace hackerai {

/**
 * @brief Blocking message boxes rendered by zenity
 *
 * OK-only boxes use --info/--warning/--error; boxes with a cancel button use
 * --question. zenity exits 0 when the OK button was pressed.
 *
 * Must be called from the main thread (wrap in MainThreadDialogService when
 * called from background tasks).
 */
class ZenityDialogService : public IDialogService {
  public:
    explicit ZenityDialogService(std::string program = "zenity");

    bool show_message(const std::string& title, const std::string& message, MessageKind kind,
                      const DialogButtons& buttons) override;

    /** @brief Argument list passed to zenity for the given dialog */
    std::vector<std::string> build_args(const std::string& title, const std::string& message,
                                        MessageKind kind, const DialogButtons& buttons) const;

  private:
    std::string program_;
};

} // namespace hackerai
