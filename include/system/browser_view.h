// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "host_services.h"

#include <string>
#include <vector>

namespace hackerai {

/**
 * @brief IWebView backed by an external browser launcher
 *
 * navigate() runs `<launcher...> <url>` and succeeds when the launcher exits
 * 0. The launcher is a whitespace-separated command line from config, e.g.
 * "xdg-open" or "chromium --app". Only absolute http(s) URLs are opened.
 */
class BrowserView : public IWebView {
  public:
    explicit BrowserView(const std::string& launcher = "xdg-open");

    bool navigate(const std::string& url, std::string& error) override;
    void focus() override;

    const std::string& current_url() const {
        return current_url_;
    }

    /** @brief Full argument list for opening url */
    std::vector<std::string> build_args(const std::string& url) const;

  private:
    std::vector<std::string> launcher_;
    std::string current_url_;
};

} // namespace hackerai
