// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/process_exec.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hackerai {

namespace {

constexpr int EXEC_FAILED_EXIT_CODE = 127;

std::string find_tool(const std::string& name) {
    static const char* const SEARCH_DIRS[] = {"/usr/bin", "/bin",           "/usr/sbin",
                                              "/sbin",    "/usr/local/bin", nullptr};
    for (int i = 0; SEARCH_DIRS[i]; ++i) {
        std::string path = std::string(SEARCH_DIRS[i]) + "/" + name;
        if (access(path.c_str(), X_OK) == 0) {
            return path;
        }
    }
    return "";
}

} // namespace

std::string resolve_tool(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    std::string path = find_tool(name);
    if (path.empty()) {
        spdlog::debug("[ProcessExec] '{}' not found in standard paths, using bare name", name);
        return name;
    }
    return path;
}

bool tool_available(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }
    return !find_tool(name).empty();
}

int safe_exec(const std::vector<std::string>& args, bool capture_stderr) {
    if (args.empty()) {
        return -1;
    }

    int stderr_pipe[2] = {-1, -1};
    if (capture_stderr) {
        if (pipe(stderr_pipe) < 0) {
            capture_stderr = false; // fall back to /dev/null
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[ProcessExec] fork() failed: {}", strerror(errno));
        if (capture_stderr) {
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        return -1;
    }

    if (pid == 0) {
        // Child: stdout to /dev/null, stderr to pipe or /dev/null
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            if (!capture_stderr) {
                dup2(devnull, STDERR_FILENO);
            }
            close(devnull);
        }
        if (capture_stderr) {
            close(stderr_pipe[0]);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stderr_pipe[1]);
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        _exit(EXEC_FAILED_EXIT_CODE);
    }

    std::string stderr_output;
    if (capture_stderr) {
        close(stderr_pipe[1]);
        char buf[1024];
        ssize_t n;
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            stderr_output.append(buf, static_cast<size_t>(n));
            if (stderr_output.size() > 4096)
                break; // cap captured output
        }
        close(stderr_pipe[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("[ProcessExec] waitpid() failed: {}", strerror(errno));
            return -1;
        }
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    if (exit_code == EXEC_FAILED_EXIT_CODE) {
        spdlog::debug("[ProcessExec] '{}' could not be executed", args[0]);
    }

    if (capture_stderr && exit_code != 0 && !stderr_output.empty()) {
        while (!stderr_output.empty() &&
               (stderr_output.back() == '\n' || stderr_output.back() == '\r')) {
            stderr_output.pop_back();
        }
        spdlog::error("[ProcessExec] stderr from '{}': {}", args[0], stderr_output);
    }

    return exit_code;
}

} // namespace hackerai
