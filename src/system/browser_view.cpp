// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/browser_view.h"

#include "utils/process_exec.h"
#include "utils/url.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace hackerai {

BrowserView::BrowserView(const std::string& launcher) {
    std::istringstream words(launcher);
    std::string word;
    while (words >> word) {
        launcher_.push_back(word);
    }
    if (launcher_.empty()) {
        spdlog::warn("[BrowserView] Empty launcher configured, using xdg-open");
        launcher_.push_back("xdg-open");
    }
    launcher_[0] = resolve_tool(launcher_[0]);
}

std::vector<std::string> BrowserView::build_args(const std::string& url) const {
    std::vector<std::string> args = launcher_;
    args.push_back(url);
    return args;
}

bool BrowserView::navigate(const std::string& url, std::string& error) {
    auto parsed = parse_url(url);
    if (!parsed || (parsed->scheme != "https" && parsed->scheme != "http")) {
        error = "not an absolute http(s) URL";
        spdlog::error("[BrowserView] Refusing to open '{}': {}", parsed ? parsed->origin() : "",
                      error);
        return false;
    }

    // The browser inherits stderr and outlives the launcher: no capture
    int rc = safe_exec(build_args(url), false);
    if (rc != 0) {
        error = "launcher '" + launcher_[0] + "' exited with code " + std::to_string(rc);
        spdlog::error("[BrowserView] Navigation to {} failed: {}", parsed->origin(), error);
        return false;
    }

    current_url_ = url;
    spdlog::debug("[BrowserView] Opened {}{}", parsed->origin(), parsed->path);
    return true;
}

void BrowserView::focus() {
    // The launcher hands the page to the browser, which owns its window
    spdlog::debug("[BrowserView] Focus requested (window managed by browser)");
}

} // namespace hackerai
