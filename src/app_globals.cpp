// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file app_globals.cpp
 * @brief Process-wide application state
 */

#include "app_globals.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <unistd.h> // fork, execv, usleep

// Application quit flag (set from signal handlers and background threads)
static std::atomic<bool> g_quit_requested{false};

// Stored command-line arguments for restart capability
static std::vector<std::string> g_restart_args;
static std::string g_executable_path;

namespace {

bool is_one_shot_arg(const char* arg) {
    return strncmp(arg, "hackerai:", 9) == 0 || strcmp(arg, "--check-updates") == 0;
}

// Options given as "--opt value" (the value would otherwise look positional)
bool takes_value(const char* arg) {
    return strcmp(arg, "--log-dest") == 0 || strcmp(arg, "--log-file") == 0 ||
           strcmp(arg, "--config") == 0;
}

void handle_quit_signal(int) {
    g_quit_requested.store(true);
}

} // namespace

void app_store_argv(int argc, char** argv) {
    g_restart_args.clear();
    g_executable_path.clear();

    if (argc <= 0 || !argv || !argv[0]) {
        return;
    }

    g_executable_path = argv[0];

    const char* appimage = std::getenv("APPIMAGE");
    if (appimage && appimage[0] == '/') {
        g_executable_path = appimage;
    } else {
        // Resolve to absolute path to prevent symlink/CWD attacks on restart
        char buf[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len > 0) {
            buf[len] = '\0';
            g_executable_path = buf;
        }
    }

    g_restart_args.push_back(g_executable_path);
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) {
            continue;
        }
        if (strcmp(argv[i], "--") == 0) {
            options_done = true;
        }
        // Positionals are deep-link candidates; a restart must not replay them
        if (options_done || argv[i][0] != '-' || is_one_shot_arg(argv[i])) {
            continue;
        }
        g_restart_args.push_back(argv[i]);
        if (takes_value(argv[i]) && i + 1 < argc && argv[i + 1]) {
            g_restart_args.push_back(argv[++i]);
        }
    }

    spdlog::debug("[App Globals] Stored {} command-line arguments for restart capability",
                  g_restart_args.size());
}

const std::vector<std::string>& app_restart_args() {
    return g_restart_args;
}

const std::string& app_executable_path() {
    return g_executable_path;
}

void app_request_quit() {
    spdlog::info("[App Globals] Application quit requested");
    g_quit_requested.store(true);
}

void app_request_restart() {
    spdlog::info("[App Globals] Application restart requested");

    if (g_restart_args.empty() || g_executable_path.empty()) {
        spdlog::error(
            "[App Globals] Cannot restart: argv not stored. Call app_store_argv() at startup.");
        g_quit_requested.store(true); // Fall back to quit
        return;
    }

    // Build before fork: no allocation in the child
    std::vector<char*> exec_argv;
    exec_argv.reserve(g_restart_args.size() + 1);
    for (auto& arg : g_restart_args) {
        exec_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        spdlog::error("[App Globals] Fork failed during restart: {}", strerror(errno));
        g_quit_requested.store(true); // Fall back to quit
        return;
    }

    if (pid == 0) {
        // Child process - let the parent release the instance socket first
        usleep(500000); // 500ms

        execv(g_executable_path.c_str(), exec_argv.data());

        // spdlog is not usable after fork in a threaded process
        fprintf(stderr, "[App Globals] execv failed during restart: %s\n", strerror(errno));
        _exit(1);
    }

    spdlog::info("[App Globals] Forked new process (PID {}), parent exiting", pid);
    g_quit_requested.store(true);
}

bool app_quit_requested() {
    return g_quit_requested.load();
}

void app_install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_quit_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Writes to a closed instance socket must fail with EPIPE instead
    signal(SIGPIPE, SIG_IGN);
}

void app_globals_reset() {
    g_quit_requested.store(false);
    g_restart_args.clear();
    g_executable_path.clear();
}
