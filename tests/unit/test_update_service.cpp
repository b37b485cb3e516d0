// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/update_service.h"

#include "../test_helpers/env_guard.h"

#include <catch2/catch_test_macros.hpp>

using namespace hackerai;

namespace {

const std::string PLATFORM = "linux-x86_64";

std::string static_manifest(const std::string& version) {
    return R"({
        "version": ")" +
           version + R"(",
        "notes": "Bug fixes",
        "pub_date": "2026-01-15T10:00:00Z",
        "platforms": {
            "linux-x86_64": {
                "url": "https://downloads.hackerai.co/HackerAI_x86_64.AppImage",
                "signature": "c2lnbmF0dXJl"
            },
            "linux-aarch64": {
                "url": "https://downloads.hackerai.co/HackerAI_aarch64.AppImage",
                "signature": "c2lnLWFybQ=="
            }
        }
    })";
}

} // namespace

// ============================================================================
// parse_update_manifest()
// ============================================================================

TEST_CASE("parse_update_manifest: newer version is an update", "[update_service]") {
    auto result = parse_update_manifest(static_manifest("1.4.0"), "1.3.2", PLATFORM);

    REQUIRE(result.ok());
    REQUIRE(result.update.has_value());
    REQUIRE(result.update->version == "1.4.0");
    REQUIRE(result.update->current_version == "1.3.2");
    REQUIRE(result.update->notes == "Bug fixes");
    REQUIRE(result.update->pub_date == "2026-01-15T10:00:00Z");
    REQUIRE(result.update->download_url ==
            "https://downloads.hackerai.co/HackerAI_x86_64.AppImage");
}

TEST_CASE("parse_update_manifest: picks the requested platform", "[update_service]") {
    auto result = parse_update_manifest(static_manifest("2.0.0"), "1.0.0", "linux-aarch64");
    REQUIRE(result.update.has_value());
    REQUIRE(result.update->download_url ==
            "https://downloads.hackerai.co/HackerAI_aarch64.AppImage");
}

TEST_CASE("parse_update_manifest: v prefix is accepted and stripped", "[update_service]") {
    auto result = parse_update_manifest(static_manifest("v1.4.0"), "v1.3.0", PLATFORM);
    REQUIRE(result.update.has_value());
    REQUIRE(result.update->version == "1.4.0");
}

TEST_CASE("parse_update_manifest: equal or older version is no update", "[update_service]") {
    SECTION("equal") {
        auto result = parse_update_manifest(static_manifest("1.3.2"), "1.3.2", PLATFORM);
        REQUIRE(result.ok());
        REQUIRE_FALSE(result.update.has_value());
    }
    SECTION("older") {
        auto result = parse_update_manifest(static_manifest("1.2.9"), "1.3.2", PLATFORM);
        REQUIRE(result.ok());
        REQUIRE_FALSE(result.update.has_value());
    }
    SECTION("prerelease of the running version") {
        auto result = parse_update_manifest(static_manifest("1.3.2-beta.1"), "1.3.2", PLATFORM);
        REQUIRE(result.ok());
        REQUIRE_FALSE(result.update.has_value());
    }
}

TEST_CASE("parse_update_manifest: release supersedes its prerelease", "[update_service]") {
    auto result = parse_update_manifest(static_manifest("1.4.0"), "1.4.0-rc.2", PLATFORM);
    REQUIRE(result.update.has_value());
}

TEST_CASE("parse_update_manifest: missing platform entry is an error", "[update_service]") {
    auto result = parse_update_manifest(static_manifest("1.4.0"), "1.3.2", "linux-riscv64");
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == "No update available for platform linux-riscv64");
    REQUIRE_FALSE(result.update.has_value());
}

TEST_CASE("parse_update_manifest: dynamic endpoint with top-level url", "[update_service]") {
    std::string body = R"({"version": "1.4.0", "url": "https://dl.hackerai.co/a.AppImage",
                           "signature": "sig"})";
    auto result = parse_update_manifest(body, "1.3.2", PLATFORM);
    REQUIRE(result.update.has_value());
    REQUIRE(result.update->download_url == "https://dl.hackerai.co/a.AppImage");
    REQUIRE(result.update->notes.empty());
}

TEST_CASE("parse_update_manifest: invalid manifests are errors", "[update_service]") {
    SECTION("not JSON") {
        auto result = parse_update_manifest("<html>502</html>", "1.0.0", PLATFORM);
        REQUIRE_FALSE(result.ok());
    }
    SECTION("not an object") {
        auto result = parse_update_manifest("[1, 2]", "1.0.0", PLATFORM);
        REQUIRE(result.error == "Invalid update manifest: not a JSON object");
    }
    SECTION("missing version") {
        auto result = parse_update_manifest(R"({"url": "https://x/y"})", "1.0.0", PLATFORM);
        REQUIRE(result.error == "Invalid update manifest: missing or malformed version");
    }
    SECTION("malformed version") {
        auto result = parse_update_manifest(static_manifest("1.4"), "1.0.0", PLATFORM);
        REQUIRE_FALSE(result.ok());
    }
    SECTION("non-string version") {
        auto result = parse_update_manifest(R"({"version": 2})", "1.0.0", PLATFORM);
        REQUIRE_FALSE(result.ok());
    }
    SECTION("newer version without url") {
        auto result = parse_update_manifest(R"({"version": "9.0.0"})", "1.0.0", PLATFORM);
        REQUIRE(result.error == "Invalid update manifest: missing download url");
    }
    SECTION("platforms is not an object") {
        auto result =
            parse_update_manifest(R"({"version": "9.0.0", "platforms": []})", "1.0.0", PLATFORM);
        REQUIRE_FALSE(result.ok());
    }
}

TEST_CASE("parse_update_manifest: unparseable running version is an error",
          "[update_service]") {
    auto result = parse_update_manifest(static_manifest("1.4.0"), "dev", PLATFORM);
    REQUIRE_FALSE(result.ok());
    REQUIRE_FALSE(result.update.has_value());
}

// ============================================================================
// Endpoint and platform
// ============================================================================

TEST_CASE("expand_update_endpoint substitutes placeholders", "[update_service]") {
    std::string url = expand_update_endpoint(
        "https://hackerai.co/api/desktop/update/{{target}}/{{arch}}/{{current_version}}", "1.3.2");

    REQUIRE(url.find("{{") == std::string::npos);
    REQUIRE(url.rfind("https://hackerai.co/api/desktop/update/linux/", 0) == 0);
    REQUIRE(url.substr(url.size() - 6) == "/1.3.2");
}

TEST_CASE("expand_update_endpoint leaves static URLs alone", "[update_service]") {
    REQUIRE(expand_update_endpoint("https://dl.hackerai.co/latest.json", "1.0.0") ==
            "https://dl.hackerai.co/latest.json");
}

TEST_CASE("update_platform_key names linux and the machine", "[update_service]") {
    std::string key = update_platform_key();
    REQUIRE(key.rfind("linux-", 0) == 0);
    REQUIRE(key.size() > 6);
}

// ============================================================================
// ManifestUpdateService preconditions (no network)
// ============================================================================

TEST_CASE("ManifestUpdateService: check rejects non-https endpoints", "[update_service]") {
    ManifestUpdateService service("http://hackerai.co/api/update", "1.0.0");
    auto result = service.check();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error.rfind("Update endpoint must be an https URL", 0) == 0);
}

TEST_CASE("ManifestUpdateService: install requires an AppImage", "[update_service]") {
    ManifestUpdateService service("https://hackerai.co/api/update", "1.0.0");
    UpdateInfo info;
    info.version = "1.4.0";
    info.download_url = "https://dl.hackerai.co/a.AppImage";

    SECTION("no APPIMAGE") {
        EnvGuard guard("APPIMAGE");
        REQUIRE(service.download_and_install(info) ==
                "Automatic updates are only supported for AppImage installs");
    }

    SECTION("plain http artifact") {
        EnvGuard guard("APPIMAGE", "/tmp/HackerAI.AppImage");
        info.download_url = "http://dl.hackerai.co/a.AppImage";
        REQUIRE(service.download_and_install(info) ==
                "Refusing to download update over a non-https URL");
    }
}
