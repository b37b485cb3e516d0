// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "deep_link_handler.h"

#include "../mocks/mock_host_services.h"
#include "../test_helpers/env_guard.h"
#include "../test_helpers/log_capture.h"
#include "utils/auth_validation.h"

#include <catch2/catch_test_macros.hpp>

namespace {

const std::string TOKEN = "0123456789abcdef0123456789ABCDEF0123456789abcdef0123456789ABCDEF";

std::string auth_link(const std::string& query) {
    return "hackerai://auth?" + query;
}

} // namespace

// ============================================================================
// Successful sign-in
// ============================================================================

TEST_CASE("DeepLinkHandler: token with valid origin navigates to callback", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);

    auto result = handler.handle(auth_link("token=" + TOKEN + "&origin=https://hackerai.co"));

    REQUIRE(result == DeepLinkResult::Navigated);
    REQUIRE(view.navigated_urls.size() == 1);
    REQUIRE(view.navigated_urls[0] == "https://hackerai.co/desktop-callback?token=" + TOKEN);
}

TEST_CASE("DeepLinkHandler: localhost origin is used in development", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);

    auto result =
        handler.handle(auth_link("token=" + TOKEN + "&origin=http%3A%2F%2Flocalhost%3A3000"));

    REQUIRE(result == DeepLinkResult::Navigated);
    REQUIRE(view.navigated_urls[0] == "http://localhost:3000/desktop-callback?token=" + TOKEN);
}

TEST_CASE("DeepLinkHandler: path-style auth links are accepted", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);

    SECTION("hackerai:auth") {
        REQUIRE(handler.handle("hackerai:auth?token=" + TOKEN) == DeepLinkResult::Navigated);
    }
    SECTION("hackerai:///auth") {
        REQUIRE(handler.handle("hackerai:///auth?token=" + TOKEN) == DeepLinkResult::Navigated);
    }
    REQUIRE(view.navigated_urls.size() == 1);
}

// ============================================================================
// Origin fallback
// ============================================================================

TEST_CASE("DeepLinkHandler: missing origin falls back to production", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);
    LogCapture logs;

    REQUIRE(handler.handle(auth_link("token=" + TOKEN)) == DeepLinkResult::Navigated);
    REQUIRE(view.navigated_urls[0] == "https://hackerai.co/desktop-callback?token=" + TOKEN);

    REQUIRE(logs.count(spdlog::level::warn, "missing or invalid origin") == 1);
    REQUIRE_FALSE(logs.contains(TOKEN));
}

TEST_CASE("DeepLinkHandler: disallowed origins fall back to production", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);

    SECTION("foreign host") {
        handler.handle(auth_link("token=" + TOKEN + "&origin=https://evil.com"));
    }
    SECTION("plain http production") {
        handler.handle(auth_link("token=" + TOKEN + "&origin=http://hackerai.co"));
    }
    SECTION("not a URL") {
        handler.handle(auth_link("token=" + TOKEN + "&origin=hackerai.co"));
    }

    REQUIRE(view.navigated_urls.size() == 1);
    REQUIRE(view.navigated_urls[0] == "https://hackerai.co/desktop-callback?token=" + TOKEN);
}

TEST_CASE("DeepLinkHandler: rejected origin is logged as a warning", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);
    LogCapture logs;

    handler.handle(auth_link("token=" + TOKEN + "&origin=https://evil.com"));

    REQUIRE(logs.count(spdlog::level::warn, "missing or invalid origin") == 1);
    REQUIRE_FALSE(logs.contains(TOKEN));
}

TEST_CASE("DeepLinkHandler: origin path is not carried into the redirect", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);

    handler.handle(auth_link("token=" + TOKEN + "&origin=https%3A%2F%2Fhackerai.co%2Fevil%3Fx%3D"));
    REQUIRE(view.navigated_urls[0] == "https://hackerai.co/desktop-callback?token=" + TOKEN);
}

TEST_CASE("DeepLinkHandler: resolve_origin honours custom allow-list", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV, "staging.hackerai.co");

    auto url = parse_url(auth_link("origin=https://staging.hackerai.co"));
    REQUIRE(url.has_value());
    REQUIRE(DeepLinkHandler::resolve_origin(*url) == "https://staging.hackerai.co");

    auto prod = parse_url(auth_link("origin=https://hackerai.co"));
    REQUIRE(DeepLinkHandler::resolve_origin(*prod) == PRODUCTION_ORIGIN);
}

// ============================================================================
// Navigation failures
// ============================================================================

TEST_CASE("DeepLinkHandler: failed callback navigation shows error page", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    view.fail_first_n = 1;
    DeepLinkHandler handler(view);

    auto result = handler.handle(auth_link("token=" + TOKEN + "&origin=https://hackerai.co"));

    REQUIRE(result == DeepLinkResult::NavigatedToFallback);
    REQUIRE(view.attempted_urls.size() == 2);
    REQUIRE(view.navigated_urls ==
            std::vector<std::string>{"https://hackerai.co/login?error=navigation_failed"});
}

TEST_CASE("DeepLinkHandler: gives up after fallback also fails", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    view.fail_first_n = 5;
    DeepLinkHandler handler(view);

    auto result = handler.handle(auth_link("token=" + TOKEN));

    REQUIRE(result == DeepLinkResult::NavigationFailed);
    REQUIRE(view.attempted_urls.size() == 2);
    REQUIRE(view.navigated_urls.empty());
}

// ============================================================================
// Rejected links
// ============================================================================

TEST_CASE("DeepLinkHandler: malformed token never navigates", "[deep_link]") {
    MockWebView view;
    DeepLinkHandler handler(view);

    REQUIRE(handler.handle(auth_link("token=abc")) == DeepLinkResult::MalformedToken);
    REQUIRE(handler.handle(auth_link("token=" + TOKEN + "0")) == DeepLinkResult::MalformedToken);
    REQUIRE(handler.handle(auth_link("token=" + std::string(64, 'z'))) ==
            DeepLinkResult::MalformedToken);
    REQUIRE(view.attempted_urls.empty());
}

TEST_CASE("DeepLinkHandler: error parameter without token", "[deep_link]") {
    MockWebView view;
    DeepLinkHandler handler(view);

    REQUIRE(handler.handle(auth_link("error=access_denied")) == DeepLinkResult::AuthError);
    REQUIRE(view.attempted_urls.empty());
}

TEST_CASE("DeepLinkHandler: bare auth link is reported as missing token", "[deep_link]") {
    MockWebView view;
    DeepLinkHandler handler(view);

    LogCapture logs;

    REQUIRE(handler.handle("hackerai://auth") == DeepLinkResult::MissingToken);
    REQUIRE(view.attempted_urls.empty());
    REQUIRE(logs.count(spdlog::level::warn, "without token") == 1);
}

TEST_CASE("DeepLinkHandler: the full token never reaches the log", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    view.fail_first_n = 5;
    DeepLinkHandler handler(view);
    LogCapture logs;

    handler.handle_args({"hackerai-desktop", auth_link("token=" + TOKEN)});

    REQUIRE(view.attempted_urls.size() == 2);
    REQUIRE_FALSE(logs.records().empty());
    REQUIRE_FALSE(logs.contains(TOKEN));
    REQUIRE(logs.contains(redact_token(TOKEN)));
}

TEST_CASE("DeepLinkHandler: unrelated URLs are ignored", "[deep_link]") {
    MockWebView view;
    DeepLinkHandler handler(view);

    REQUIRE(handler.handle("https://hackerai.co/auth?token=" + TOKEN) == DeepLinkResult::Ignored);
    REQUIRE(handler.handle("hackerai://settings?token=" + TOKEN) == DeepLinkResult::Ignored);
    REQUIRE(handler.handle("not a url") == DeepLinkResult::Ignored);
    REQUIRE(view.attempted_urls.empty());
}

// ============================================================================
// handle_args()
// ============================================================================

TEST_CASE("DeepLinkHandler: handle_args skips argv[0] and non-links", "[deep_link]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    MockWebView view;
    DeepLinkHandler handler(view);

    std::vector<std::string> args = {"hackerai://auth?token=" + TOKEN, "--check-updates",
                                     "/tmp/file.txt", "hackerai://auth?error=denied",
                                     "hackerai://auth?token=" + TOKEN};

    REQUIRE(handler.handle_args(args) == 2);
    REQUIRE(view.navigated_urls.size() == 1);
}

TEST_CASE("DeepLinkHandler: handle_args with no arguments", "[deep_link]") {
    MockWebView view;
    DeepLinkHandler handler(view);

    REQUIRE(handler.handle_args({}) == 0);
    REQUIRE(handler.handle_args({"/usr/bin/hackerai-desktop"}) == 0);
}

// ============================================================================
// URL builders
// ============================================================================

TEST_CASE("DeepLinkHandler: URL builders", "[deep_link]") {
    REQUIRE(DeepLinkHandler::build_callback_url("https://hackerai.co", "a b&c") ==
            "https://hackerai.co/desktop-callback?token=a+b%26c");
    REQUIRE(DeepLinkHandler::build_error_url("http://localhost:3000") ==
            "http://localhost:3000/login?error=navigation_failed");
}

TEST_CASE("deep_link_result_name", "[deep_link]") {
    REQUIRE(std::string(deep_link_result_name(DeepLinkResult::Navigated)) == "navigated");
    REQUIRE(std::string(deep_link_result_name(DeepLinkResult::MissingToken)) == "missing_token");
}
