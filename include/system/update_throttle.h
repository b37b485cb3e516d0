// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file update_throttle.h
 * @brief Persisted "last update check" timestamp
 *
 * File: <app-data-dir>/last_update_check, plain decimal POSIX seconds.
 * Every read or write problem biases toward checking again: a missing,
 * unreadable or garbled file, or no app-data directory at all, makes the
 * next check due.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace hackerai {

class UpdateThrottle {
  public:
    static constexpr const char* FILE_NAME = "last_update_check";
    static constexpr uint64_t DEFAULT_CHECK_INTERVAL_SEC = 24 * 60 * 60;

    /**
     * @param data_dir App data directory; empty means none could be resolved
     * @param check_interval_sec Minimum seconds between background checks
     */
    explicit UpdateThrottle(std::string data_dir,
                            uint64_t check_interval_sec = DEFAULT_CHECK_INTERVAL_SEC);

    /**
     * @brief Record a check attempt
     *
     * Creates the data directory if needed. Failures are logged, never thrown.
     *
     * @param now_sec Current POSIX time in seconds
     * @return true if the timestamp was written
     */
    bool save(uint64_t now_sec) const;

    /**
     * @brief Read the last check timestamp
     * @return Seconds since epoch, or nullopt if missing or unparseable
     */
    std::optional<uint64_t> load() const;

    /**
     * @brief Whether a background check should run now
     *
     * Due when the stored timestamp is at least check_interval old, or when
     * it cannot be read. A timestamp in the future is treated as fresh.
     */
    bool is_check_due(uint64_t now_sec) const;

    /** @brief Full path of the timestamp file (empty without a data dir) */
    std::string file_path() const;

    uint64_t check_interval_sec() const {
        return check_interval_sec_;
    }

    /** @brief Current POSIX time in seconds */
    static uint64_t now_seconds();

  private:
    std::string data_dir_;
    uint64_t check_interval_sec_;
};

} // namespace hackerai
