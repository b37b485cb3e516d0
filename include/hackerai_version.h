// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>

// Injected by the build (-DHACKERAI_VERSION="x.y.z")
#ifndef HACKERAI_VERSION
#define HACKERAI_VERSION "0.0.0-dev"
#endif

namespace hackerai::version {

/**
 * @brief Parsed MAJOR.MINOR.PATCH[-prerelease][+build] version
 *
 * Ordering follows semver precedence: a prerelease sorts before the release,
 * prerelease identifiers compare numerically when both are numeric,
 * build metadata is ignored.
 */
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const {
        return !(*this == o);
    }
    bool operator<(const Version& o) const;
    bool operator>(const Version& o) const {
        return o < *this;
    }
    bool operator<=(const Version& o) const {
        return !(o < *this);
    }
    bool operator>=(const Version& o) const {
        return !(*this < o);
    }

    std::string to_string() const;
};

/**
 * @brief Parse a version string
 *
 * Accepts an optional leading 'v'/'V'.
 *
 * @return Parsed version, or nullopt if malformed
 */
std::optional<Version> parse_version(const std::string& str);

/** @brief Version this binary was built as */
inline const char* current() {
    return HACKERAI_VERSION;
}

} // namespace hackerai::version
