// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hackerai_version.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace hackerai::version {

namespace {

bool is_numeric(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Numeric component without leading zeros (semver 2.0.0 section 2)
bool parse_component(const std::string& s, int& out) {
    if (!is_numeric(s) || s.size() > 9 || (s.size() > 1 && s[0] == '0')) {
        return false;
    }
    out = static_cast<int>(std::strtol(s.c_str(), nullptr, 10));
    return true;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

int compare_prerelease(const std::string& a, const std::string& b) {
    if (a == b)
        return 0;
    // A release (no prerelease) has higher precedence
    if (a.empty())
        return 1;
    if (b.empty())
        return -1;

    auto ids_a = split(a, '.');
    auto ids_b = split(b, '.');
    size_t n = std::min(ids_a.size(), ids_b.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& x = ids_a[i];
        const auto& y = ids_b[i];
        if (x == y)
            continue;
        bool xn = is_numeric(x);
        bool yn = is_numeric(y);
        if (xn && yn) {
            long lx = std::strtol(x.c_str(), nullptr, 10);
            long ly = std::strtol(y.c_str(), nullptr, 10);
            return lx < ly ? -1 : 1;
        }
        if (xn != yn) {
            return xn ? -1 : 1; // numeric identifiers sort first
        }
        return x < y ? -1 : 1;
    }
    if (ids_a.size() == ids_b.size())
        return 0;
    return ids_a.size() < ids_b.size() ? -1 : 1;
}

} // namespace

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch && prerelease == o.prerelease;
}

bool Version::operator<(const Version& o) const {
    if (major != o.major)
        return major < o.major;
    if (minor != o.minor)
        return minor < o.minor;
    if (patch != o.patch)
        return patch < o.patch;
    return compare_prerelease(prerelease, o.prerelease) < 0;
}

std::string Version::to_string() const {
    std::string s =
        std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + prerelease;
    }
    return s;
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = str;
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s.erase(0, 1);
    }

    // Build metadata does not participate in precedence
    auto plus = s.find('+');
    if (plus != std::string::npos) {
        s.erase(plus);
    }

    Version v;
    auto dash = s.find('-');
    if (dash != std::string::npos) {
        v.prerelease = s.substr(dash + 1);
        s.erase(dash);
        if (v.prerelease.empty()) {
            return std::nullopt;
        }
        for (const auto& id : split(v.prerelease, '.')) {
            if (id.empty() || !std::all_of(id.begin(), id.end(), [](unsigned char c) {
                    return std::isalnum(c) || c == '-';
                })) {
                return std::nullopt;
            }
        }
    }

    auto parts = split(s, '.');
    if (parts.size() != 3) {
        return std::nullopt;
    }
    if (!parse_component(parts[0], v.major) || !parse_component(parts[1], v.minor) ||
        !parse_component(parts[2], v.patch)) {
        return std::nullopt;
    }
    return v;
}

} // namespace hackerai::version
