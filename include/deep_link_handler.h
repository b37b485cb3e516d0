// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file deep_link_handler.h
 * @brief Routes hackerai:// auth deep links into the embedded view
 *
 * A deep link carries a desktop auth token minted by the web login flow:
 *
 *   hackerai://auth?token=<64 hex>&origin=https://hackerai.co
 *
 * The token is format-checked and the origin is checked against the
 * allow-list before anything reaches the view. Invalid input never causes a
 * navigation; an invalid or missing origin falls back to production.
 */

#include "host_services.h"
#include "utils/url.h"

#include <string>
#include <vector>

namespace hackerai {

constexpr const char* DEEP_LINK_SCHEME = "hackerai";

enum class DeepLinkResult {
    Ignored,             ///< Not a hackerai:// auth link
    Navigated,           ///< View sent to the desktop callback
    NavigatedToFallback, ///< Callback navigation failed, error page shown
    NavigationFailed,    ///< Both navigations failed
    MalformedToken,      ///< Token present but not 64 hex chars
    AuthError,           ///< No token, error parameter present
    MissingToken         ///< No token, no error parameter
};

const char* deep_link_result_name(DeepLinkResult result);

class DeepLinkHandler {
  public:
    explicit DeepLinkHandler(IWebView& view);

    /**
     * @brief Handle one deep link
     * @param url Parsed URL
     */
    DeepLinkResult handle(const Url& url);

    /**
     * @brief Parse and handle a deep link string
     *
     * Strings that are not absolute URLs are ignored.
     */
    DeepLinkResult handle(const std::string& url);

    /**
     * @brief Handle deep links found in process arguments
     *
     * args[0] (the program) is skipped; every other argument that parses as a
     * hackerai:// URL is handled in order.
     *
     * @return Number of hackerai:// arguments processed
     */
    int handle_args(const std::vector<std::string>& args);

    /** @brief Callback URL for a validated token and origin */
    static std::string build_callback_url(const std::string& origin, const std::string& token);

    /** @brief Error page used when the callback navigation fails */
    static std::string build_error_url(const std::string& origin);

    /**
     * @brief Pick the redirect origin for a deep link
     *
     * Returns the origin of the "origin" query parameter when it passes
     * validate_origin(), otherwise the production origin.
     */
    static std::string resolve_origin(const Url& url);

  private:
    static bool is_auth_link(const Url& url);

    DeepLinkResult navigate_with_token(const Url& url, const std::string& token);

    IWebView& view_;
};

} // namespace hackerai
