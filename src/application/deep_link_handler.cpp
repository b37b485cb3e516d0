// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "deep_link_handler.h"

#include "utils/auth_validation.h"

#include <spdlog/spdlog.h>

namespace hackerai {

const char* deep_link_result_name(DeepLinkResult result) {
    switch (result) {
    case DeepLinkResult::Ignored:
        return "ignored";
    case DeepLinkResult::Navigated:
        return "navigated";
    case DeepLinkResult::NavigatedToFallback:
        return "navigated_to_fallback";
    case DeepLinkResult::NavigationFailed:
        return "navigation_failed";
    case DeepLinkResult::MalformedToken:
        return "malformed_token";
    case DeepLinkResult::AuthError:
        return "auth_error";
    case DeepLinkResult::MissingToken:
        return "missing_token";
    }
    return "unknown";
}

DeepLinkHandler::DeepLinkHandler(IWebView& view) : view_(view) {}

bool DeepLinkHandler::is_auth_link(const Url& url) {
    return url.host == "auth" || url.path == "/auth" || url.path == "auth";
}

std::string DeepLinkHandler::build_callback_url(const std::string& origin,
                                                const std::string& token) {
    return origin + "/desktop-callback?token=" + form_urlencode(token);
}

std::string DeepLinkHandler::build_error_url(const std::string& origin) {
    return origin + "/login?error=navigation_failed";
}

std::string DeepLinkHandler::resolve_origin(const Url& url) {
    auto origin_param = query_value(url, "origin");
    if (origin_param && validate_origin(*origin_param)) {
        // Only scheme://host[:port] is kept so a path in the parameter cannot steer the redirect
        return parse_url(*origin_param)->origin();
    }

    spdlog::warn("[DeepLink] Deep link has missing or invalid origin, using production");
    return PRODUCTION_ORIGIN;
}

DeepLinkResult DeepLinkHandler::handle(const std::string& url) {
    auto parsed = parse_url(url);
    if (!parsed) {
        spdlog::debug("[DeepLink] Ignoring argument that is not an absolute URL");
        return DeepLinkResult::Ignored;
    }
    return handle(*parsed);
}

DeepLinkResult DeepLinkHandler::handle(const Url& url) {
    if (url.scheme != DEEP_LINK_SCHEME) {
        return DeepLinkResult::Ignored;
    }

    if (!is_auth_link(url)) {
        spdlog::debug("[DeepLink] Ignoring non-auth deep link (host='{}', path='{}')", url.host,
                      url.path);
        return DeepLinkResult::Ignored;
    }

    auto token = query_value(url, "token");
    if (token) {
        if (!is_valid_token_format(*token)) {
            spdlog::error("[DeepLink] Invalid token format in deep link");
            return DeepLinkResult::MalformedToken;
        }
        return navigate_with_token(url, *token);
    }

    auto error = query_value(url, "error");
    if (error) {
        spdlog::error("[DeepLink] Auth deep link received with error: {}", *error);
        return DeepLinkResult::AuthError;
    }

    spdlog::warn("[DeepLink] Auth deep link received without token: {}://{}{}", url.scheme,
                 url.host, url.path);
    return DeepLinkResult::MissingToken;
}

DeepLinkResult DeepLinkHandler::navigate_with_token(const Url& url, const std::string& token) {
    const std::string origin = resolve_origin(url);
    const std::string callback_url = build_callback_url(origin, token);

    spdlog::info("[DeepLink] Navigating to desktop callback (token: {})", redact_token(token));

    std::string error;
    if (view_.navigate(callback_url, error)) {
        return DeepLinkResult::Navigated;
    }

    spdlog::error("[DeepLink] Failed to navigate to callback URL: {}", error);

    std::string fallback_error;
    if (view_.navigate(build_error_url(origin), fallback_error)) {
        return DeepLinkResult::NavigatedToFallback;
    }

    spdlog::error("[DeepLink] Fallback navigation to error page failed: {}", fallback_error);
    return DeepLinkResult::NavigationFailed;
}

int DeepLinkHandler::handle_args(const std::vector<std::string>& args) {
    int processed = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        auto parsed = parse_url(args[i]);
        if (!parsed || parsed->scheme != DEEP_LINK_SCHEME) {
            continue;
        }
        spdlog::info("[DeepLink] Processing deep link from CLI arg");
        auto result = handle(*parsed);
        spdlog::debug("[DeepLink] Result: {}", deep_link_result_name(result));
        ++processed;
    }
    return processed;
}

} // namespace hackerai
