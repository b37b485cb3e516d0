// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace hackerai {
namespace logging {

/// Where log output goes besides the console
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog
    Journal, ///< systemd journal (needs HACKERAI_HAS_SYSTEMD)
    Syslog,  ///< Traditional syslog
    File,    ///< Rotating file under the app data directory
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path;   ///< Explicit log file (File target)
    std::string data_dir;    ///< App data dir, default home of the log file
};

/**
 * @brief Install a console-only logger
 *
 * Used before configuration is loaded so that early log calls have a sink.
 */
void init_early();

/**
 * @brief Build the default logger from config
 *
 * Console sink (unless disabled) plus the system sink for the target. Auto
 * resolves to the journal when its socket exists, else syslog.
 */
void init(const LogConfig& config);

/** @brief Log file used for LogTarget::File */
std::string resolve_log_file_path(const std::string& override_path, const std::string& data_dir);

/** @brief "trace".."off" (and "warning") to a level, default_level otherwise */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/** @brief -v count to level: 1 info, 2 debug, 3+ trace, else warn */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Effective level: CLI verbosity wins, then the config string
 *
 * @param verbosity Count of -v flags
 * @param config_level /log_level value ("" when unset)
 */
spdlog::level::level_enum resolve_level(int verbosity, const std::string& config_level);

/** @brief spdlog level to libhv's LOG_LEVEL_* (trace capped at DEBUG) */
int to_hv_level(spdlog::level::level_enum level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace hackerai
