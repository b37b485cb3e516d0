// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace hackerai {

/**
 * @brief Resolve a system tool to an absolute path, falling back to bare name
 *
 * Searches well-known absolute locations before falling back to the bare
 * name (which relies on $PATH). Desktop launchers sometimes start us with a
 * minimal PATH.
 *
 * @param name Tool name (e.g. "zenity", "xdg-open")
 * @return Absolute path if found, bare name otherwise
 */
std::string resolve_tool(const std::string& name);

/** @brief Whether resolve_tool() finds an executable for name */
bool tool_available(const std::string& name);

/**
 * @brief Execute a command via fork/exec (no shell interpretation)
 *
 * Stdout is discarded. Stderr is captured into the log on failure when
 * capture_stderr is set, discarded otherwise. Capturing reads the pipe until
 * EOF, so it waits for every process that inherited stderr; leave it off for
 * launchers that start long-lived children.
 *
 * @param args Argument list (args[0] is the program)
 * @param capture_stderr Log the child's stderr if it exits non-zero
 * @return Exit code of the child, or -1 on fork/exec/wait failure
 */
int safe_exec(const std::vector<std::string>& args, bool capture_stderr = false);

} // namespace hackerai
