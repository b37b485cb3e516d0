// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "deep_link_registrar.h"

#include "deep_link_handler.h"
#include "utils/process_exec.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace hackerai {

namespace {

// freedesktop Exec key: quote arguments containing reserved characters
std::string quote_exec_arg(const std::string& arg) {
    if (arg.find_first_of(" \t\"'\\$`<>|;&*?#()") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"' || c == '`' || c == '$' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string scheme_mime_type() {
    return std::string("x-scheme-handler/") + DEEP_LINK_SCHEME;
}

} // namespace

DeepLinkRegistrar::DeepLinkRegistrar(std::string applications_dir)
    : applications_dir_(applications_dir.empty() ? default_applications_dir()
                                                 : std::move(applications_dir)) {}

std::string DeepLinkRegistrar::default_applications_dir() {
    const char* data_home = std::getenv("XDG_DATA_HOME");
    if (data_home && data_home[0] == '/') {
        return std::string(data_home) + "/applications";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share/applications";
    }
    return "";
}

std::string DeepLinkRegistrar::desktop_file_path() const {
    if (applications_dir_.empty()) {
        return "";
    }
    return (fs::path(applications_dir_) / DESKTOP_FILE_NAME).string();
}

std::string DeepLinkRegistrar::desktop_entry(const std::string& exe_path) {
    std::ostringstream out;
    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Name=HackerAI\n"
        << "Comment=Handle " << DEEP_LINK_SCHEME << ":// sign-in links\n"
        << "Exec=" << quote_exec_arg(exe_path) << " %u\n"
        << "Terminal=false\n"
        << "NoDisplay=true\n"
        << "MimeType=" << scheme_mime_type() << ";\n";
    return out.str();
}

bool DeepLinkRegistrar::register_scheme(const std::string& exe_path) {
    std::string path = desktop_file_path();
    if (path.empty()) {
        spdlog::warn("[DeepLinkRegistrar] No applications directory (HOME unset), "
                     "skipping {}:// registration",
                     DEEP_LINK_SCHEME);
        return false;
    }
    if (exe_path.empty()) {
        spdlog::warn("[DeepLinkRegistrar] Executable path unknown, skipping registration");
        return false;
    }

    std::error_code ec;
    fs::create_directories(applications_dir_, ec);
    if (ec) {
        spdlog::warn("[DeepLinkRegistrar] Cannot create {}: {}", applications_dir_, ec.message());
        return false;
    }

    std::string entry = desktop_entry(exe_path);

    // Skip the rewrite when nothing changed, so repeated launches leave mtime alone
    bool unchanged = false;
    {
        std::ifstream existing(path);
        if (existing) {
            std::stringstream buf;
            buf << existing.rdbuf();
            unchanged = buf.str() == entry;
        }
    }

    if (!unchanged) {
        std::ofstream out(path, std::ios::trunc);
        out << entry;
        out.close();
        if (!out) {
            spdlog::warn("[DeepLinkRegistrar] Failed to write {}", path);
            return false;
        }
        spdlog::info("[DeepLinkRegistrar] Wrote {}", path);
    }

    if (!tool_available("xdg-mime")) {
        spdlog::warn("[DeepLinkRegistrar] xdg-mime not installed, {}:// links may not open",
                     DEEP_LINK_SCHEME);
        return false;
    }

    int rc = safe_exec({resolve_tool("xdg-mime"), "default", DESKTOP_FILE_NAME,
                        scheme_mime_type()},
                       true);
    if (rc != 0) {
        spdlog::warn("[DeepLinkRegistrar] xdg-mime default failed (exit {})", rc);
        return false;
    }

    if (tool_available("update-desktop-database")) {
        int db_rc = safe_exec({resolve_tool("update-desktop-database"), applications_dir_});
        if (db_rc != 0) {
            spdlog::debug("[DeepLinkRegistrar] update-desktop-database exited {}", db_rc);
        }
    }

    spdlog::info("[DeepLinkRegistrar] Registered as handler for {}", scheme_mime_type());
    return true;
}

} // namespace hackerai
