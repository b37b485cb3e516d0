// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/update_throttle.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace hackerai {

namespace {

std::optional<uint64_t> parse_seconds(const std::string& content) {
    size_t start = 0;
    size_t end = content.size();
    while (start < end && std::isspace(static_cast<unsigned char>(content[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(content[end - 1]))) {
        --end;
    }
    if (start == end) {
        return std::nullopt;
    }

    std::string digits = content.substr(start, end - start);
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    errno = 0;
    unsigned long long value = std::strtoull(digits.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

} // namespace

UpdateThrottle::UpdateThrottle(std::string data_dir, uint64_t check_interval_sec)
    : data_dir_(std::move(data_dir)), check_interval_sec_(check_interval_sec) {}

std::string UpdateThrottle::file_path() const {
    if (data_dir_.empty()) {
        return {};
    }
    return (fs::path(data_dir_) / FILE_NAME).string();
}

uint64_t UpdateThrottle::now_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    return secs > 0 ? static_cast<uint64_t>(secs) : 0;
}

bool UpdateThrottle::save(uint64_t now_sec) const {
    if (data_dir_.empty()) {
        spdlog::warn("[UpdateThrottle] No app data directory, not saving update check timestamp");
        return false;
    }

    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        spdlog::warn("[UpdateThrottle] Failed to create {}: {}", data_dir_, ec.message());
        // Fall through: the directory may still exist
    }

    std::string path = file_path();
    std::ofstream file(path, std::ios::trunc);
    if (!file.good()) {
        spdlog::warn("[UpdateThrottle] Failed to save update check timestamp to {}", path);
        return false;
    }
    file << now_sec;
    file.flush();
    if (!file.good()) {
        spdlog::warn("[UpdateThrottle] Failed to write update check timestamp to {}", path);
        return false;
    }

    spdlog::trace("[UpdateThrottle] Saved timestamp {} to {}", now_sec, path);
    return true;
}

std::optional<uint64_t> UpdateThrottle::load() const {
    std::string path = file_path();
    if (path.empty()) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.good()) {
        spdlog::debug("[UpdateThrottle] No timestamp file at {}", path);
        return std::nullopt;
    }

    std::stringstream buf;
    buf << file.rdbuf();
    auto value = parse_seconds(buf.str());
    if (!value) {
        spdlog::warn("[UpdateThrottle] Unparseable timestamp in {}, treating check as due", path);
    }
    return value;
}

bool UpdateThrottle::is_check_due(uint64_t now_sec) const {
    auto last = load();
    if (!last) {
        return true;
    }
    uint64_t elapsed = (now_sec > *last) ? now_sec - *last : 0;
    return elapsed >= check_interval_sec_;
}

} // namespace hackerai
