// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/update_throttle.h"

#include "../test_helpers/temp_dir.h"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace hackerai;
namespace fs = std::filesystem;

namespace {

constexpr uint64_t DAY = 86400;
constexpr uint64_t NOW = 1'750'000'000;

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

} // namespace

// ============================================================================
// save() / load()
// ============================================================================

TEST_CASE("UpdateThrottle: save then load returns the timestamp", "[update_throttle]") {
    TempDir dir("hackerai_throttle_test");
    UpdateThrottle throttle(dir.str());

    REQUIRE(throttle.save(NOW));
    REQUIRE(throttle.load() == std::optional<uint64_t>(NOW));
    REQUIRE(throttle.file_path() == (dir.path() / "last_update_check").string());
}

TEST_CASE("UpdateThrottle: save creates missing directories", "[update_throttle]") {
    TempDir dir("hackerai_throttle_test");
    std::string nested = (dir.path() / "a" / "b").string();
    UpdateThrottle throttle(nested);

    REQUIRE(throttle.save(NOW));
    REQUIRE(fs::exists(fs::path(nested) / UpdateThrottle::FILE_NAME));
}

TEST_CASE("UpdateThrottle: load tolerates surrounding whitespace", "[update_throttle]") {
    TempDir dir("hackerai_throttle_test");
    UpdateThrottle throttle(dir.str());
    write_file(throttle.file_path(), "  1750000000\n");

    REQUIRE(throttle.load() == std::optional<uint64_t>(NOW));
}

TEST_CASE("UpdateThrottle: unparseable contents load as nullopt", "[update_throttle]") {
    TempDir dir("hackerai_throttle_test");
    UpdateThrottle throttle(dir.str());

    SECTION("garbage") {
        write_file(throttle.file_path(), "yesterday");
    }
    SECTION("negative") {
        write_file(throttle.file_path(), "-5");
    }
    SECTION("empty") {
        write_file(throttle.file_path(), "");
    }
    SECTION("overflow") {
        write_file(throttle.file_path(), "999999999999999999999999");
    }

    REQUIRE_FALSE(throttle.load().has_value());
    REQUIRE(throttle.is_check_due(NOW));
}

// ============================================================================
// is_check_due()
// ============================================================================

TEST_CASE("UpdateThrottle: due exactly at the interval boundary", "[update_throttle]") {
    TempDir dir("hackerai_throttle_test");
    UpdateThrottle throttle(dir.str());

    SECTION("missing file is due") {
        REQUIRE(throttle.is_check_due(NOW));
    }

    SECTION("one second short is not due") {
        REQUIRE(throttle.save(NOW - DAY + 1));
        REQUIRE_FALSE(throttle.is_check_due(NOW));
    }

    SECTION("exactly 86400 seconds is due") {
        REQUIRE(throttle.save(NOW - DAY));
        REQUIRE(throttle.is_check_due(NOW));
    }

    SECTION("long ago is due") {
        REQUIRE(throttle.save(NOW - 30 * DAY));
        REQUIRE(throttle.is_check_due(NOW));
    }

    SECTION("timestamp in the future is not due") {
        REQUIRE(throttle.save(NOW + 3600));
        REQUIRE_FALSE(throttle.is_check_due(NOW));
    }
}

TEST_CASE("UpdateThrottle: custom interval", "[update_throttle]") {
    TempDir dir("hackerai_throttle_test");
    UpdateThrottle throttle(dir.str(), 60);

    REQUIRE(throttle.check_interval_sec() == 60);
    REQUIRE(throttle.save(NOW));
    REQUIRE_FALSE(throttle.is_check_due(NOW + 59));
    REQUIRE(throttle.is_check_due(NOW + 60));
}

TEST_CASE("UpdateThrottle: no data directory fails open", "[update_throttle]") {
    UpdateThrottle throttle("");

    REQUIRE(throttle.file_path().empty());
    REQUIRE_FALSE(throttle.save(NOW));
    REQUIRE_FALSE(throttle.load().has_value());
    REQUIRE(throttle.is_check_due(NOW));
}

TEST_CASE("UpdateThrottle: now_seconds is a plausible epoch time", "[update_throttle]") {
    REQUIRE(UpdateThrottle::now_seconds() > NOW - 365 * DAY);
}
