// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file app_globals.h
 * @brief Process-wide application state: argv for restart, quit flag
 */

#include <string>
#include <vector>

/**
 * @brief Store command-line arguments for later restart
 *
 * Call once at startup. The restart argv keeps options but drops one-shot
 * inputs (hackerai:// links and --check-updates) so they aren't replayed.
 */
void app_store_argv(int argc, char** argv);

/** @brief Arguments that a restart would exec (argv[0] first) */
const std::vector<std::string>& app_restart_args();

/**
 * @brief Absolute path of the launchable executable
 *
 * $APPIMAGE when running from an AppImage (the mounted /proc/self/exe goes
 * away on exit), otherwise the resolved /proc/self/exe.
 */
const std::string& app_executable_path();

/** @brief Ask the main loop to exit */
void app_request_quit();

/**
 * @brief Start a fresh copy of the app and quit this one
 *
 * Forks and execs app_executable_path() with app_restart_args(). Falls back
 * to a plain quit when that is not possible.
 */
void app_request_restart();

bool app_quit_requested();

/** @brief Install SIGINT/SIGTERM handlers that request quit */
void app_install_signal_handlers();

/** @brief Reset state (tests) */
void app_globals_reset();
