// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/auth_validation.h"

#include "../test_helpers/env_guard.h"

#include <catch2/catch_test_macros.hpp>

using namespace hackerai;

namespace {
const std::string VALID_TOKEN(64, 'a');
} // namespace

// ============================================================================
// Token format
// ============================================================================

TEST_CASE("is_valid_token_format: accepts 64 hex characters", "[auth][token]") {
    REQUIRE(is_valid_token_format(VALID_TOKEN));
    REQUIRE(is_valid_token_format(std::string(32, 'F') + std::string(32, '9')));
}

TEST_CASE("is_valid_token_format: rejects wrong length or characters", "[auth][token]") {
    REQUIRE_FALSE(is_valid_token_format(""));
    REQUIRE_FALSE(is_valid_token_format(std::string(63, 'a')));
    REQUIRE_FALSE(is_valid_token_format(std::string(65, 'a')));
    REQUIRE_FALSE(is_valid_token_format(std::string(63, 'a') + "g"));
    REQUIRE_FALSE(is_valid_token_format(std::string(63, 'a') + " "));
}

TEST_CASE("redact_token keeps at most 8 characters", "[auth][token]") {
    REQUIRE(redact_token("0123456789abcdef") == "01234567...");
    REQUIRE(redact_token("abc") == "abc...");
    REQUIRE(redact_token("") == "...");
}

// ============================================================================
// Allowed hosts
// ============================================================================

TEST_CASE("get_allowed_hosts: defaults when unset", "[auth][origin]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);
    auto hosts = get_allowed_hosts();
    REQUIRE(hosts == std::vector<std::string>{"hackerai.co", "localhost"});
}

TEST_CASE("get_allowed_hosts: parses comma-separated list", "[auth][origin]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV, " staging.hackerai.co , ,localhost ");
    auto hosts = get_allowed_hosts();
    REQUIRE(hosts == std::vector<std::string>{"staging.hackerai.co", "localhost"});
}

TEST_CASE("get_allowed_hosts: empty variable allows nothing", "[auth][origin]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV, "");
    REQUIRE(get_allowed_hosts().empty());
    REQUIRE_FALSE(validate_origin("https://hackerai.co"));
}

// ============================================================================
// validate_origin()
// ============================================================================

TEST_CASE("validate_origin: default allow-list", "[auth][origin]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV);

    SECTION("production over https") {
        REQUIRE(validate_origin("https://hackerai.co"));
        REQUIRE(validate_origin("https://hackerai.co/some/path"));
    }

    SECTION("localhost over http or https") {
        REQUIRE(validate_origin("http://localhost:3000"));
        REQUIRE(validate_origin("https://localhost"));
    }

    SECTION("production over http is rejected") {
        REQUIRE_FALSE(validate_origin("http://hackerai.co"));
    }

    SECTION("lookalike hosts are rejected") {
        REQUIRE_FALSE(validate_origin("https://hackerai.co.evil.com"));
        REQUIRE_FALSE(validate_origin("https://evilhackerai.co"));
        REQUIRE_FALSE(validate_origin("https://sub.hackerai.co"));
    }

    SECTION("userinfo does not fool the host check") {
        REQUIRE_FALSE(validate_origin("https://hackerai.co@evil.com"));
        REQUIRE(validate_origin("https://evil.com@hackerai.co"));
    }

    SECTION("other schemes are rejected") {
        REQUIRE_FALSE(validate_origin("ftp://hackerai.co"));
        REQUIRE_FALSE(validate_origin("javascript:alert(1)"));
    }

    SECTION("not a URL") {
        REQUIRE_FALSE(validate_origin(""));
        REQUIRE_FALSE(validate_origin("hackerai.co"));
    }
}

TEST_CASE("validate_origin: custom allow-list", "[auth][origin]") {
    EnvGuard guard(ALLOWED_HOSTS_ENV, "staging.hackerai.co");

    REQUIRE(validate_origin("https://staging.hackerai.co"));
    REQUIRE_FALSE(validate_origin("https://hackerai.co"));
    REQUIRE_FALSE(validate_origin("http://localhost:3000"));
}
