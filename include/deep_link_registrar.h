// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace hackerai {

/**
 * @brief Registers this executable as the desktop handler for hackerai:// links
 *
 * Writes an XDG desktop entry into the user's applications directory and
 * makes it the default for x-scheme-handler/hackerai. Registration is best
 * effort: failures are logged as warnings and the app keeps running.
 */
class DeepLinkRegistrar {
  public:
    static constexpr const char* DESKTOP_FILE_NAME = "co.hackerai.desktop-handler.desktop";

    /**
     * @param applications_dir Target directory; empty resolves
     *        $XDG_DATA_HOME/applications (or ~/.local/share/applications)
     */
    explicit DeepLinkRegistrar(std::string applications_dir = "");

    /**
     * @brief Write the desktop entry and set it as the scheme default
     *
     * @param exe_path Absolute path launched for each link (AppImage path when
     *        running from one)
     * @return true if the desktop entry was written and xdg-mime succeeded
     */
    bool register_scheme(const std::string& exe_path);

    /** @brief Contents of the desktop entry for exe_path */
    static std::string desktop_entry(const std::string& exe_path);

    /** @brief $XDG_DATA_HOME/applications, ~/.local/share/applications, or "" */
    static std::string default_applications_dir();

    std::string desktop_file_path() const;

  private:
    std::string applications_dir_;
};

} // namespace hackerai
