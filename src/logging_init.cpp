// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <vector>

#include "hv/hlog.h"

#ifdef __linux__
#ifdef HACKERAI_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace hackerai {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "hackerai";
constexpr const char* SYSLOG_IDENT = "hackerai-desktop";
constexpr const char* LOG_FILE_NAME = "hackerai.log";
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

/// Detect best available logging target at runtime
LogTarget detect_best_target() {
#ifdef __linux__
#ifdef HACKERAI_HAS_SYSTEMD
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    // Syslog is always available on Linux
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Add system sink based on target
void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const LogConfig& config) {
    switch (target) {
#ifdef __linux__
#ifdef HACKERAI_HAS_SYSTEMD
    case LogTarget::Journal:
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>(SYSLOG_IDENT));
        break;
#else
    case LogTarget::Journal:
#endif
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>(SYSLOG_IDENT, LOG_PID, LOG_USER, false));
        break;
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(config.file_path, config.data_dir);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep going with the console sink
            spdlog::error("[Logging] Cannot open log file {}: {}", path, e.what());
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
}

} // namespace

void init_early() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
    }
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    // libhv's default level is INFO; quiet it before any request is made
    hlog_set_level(LOG_LEVEL_WARN);
}

std::string resolve_log_file_path(const std::string& override_path, const std::string& data_dir) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string dir = data_dir.empty() ? "/tmp" : data_dir + "/logs";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    return dir + "/" + LOG_FILE_NAME;
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    add_system_sink(sinks, effective_target, config);

    // Replace the early logger of the same name
    spdlog::drop(LOGGER_NAME);
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    hlog_set_level(to_hv_level(config.level));

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity >= 3 ? spdlog::level::trace : spdlog::level::warn;
    }
}

spdlog::level::level_enum resolve_level(int verbosity, const std::string& config_level) {
    if (verbosity > 0) {
        return verbosity_to_level(verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG; // libhv VERBOSE is too noisy
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace hackerai
