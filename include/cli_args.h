// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for hackerai-desktop
 */

#include <string>
#include <vector>

namespace hackerai {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest override ("" = use config)
    std::string log_file; // --log-file override

    // Configuration
    std::string config_path; // --config override

    // Updates
    bool check_updates = false;   // --check-updates: interactive check at startup
    bool no_update_check = false; // --no-update-check: no background scheduler

    // Desktop integration
    bool no_register = false; // --no-register: skip hackerai:// registration

    // Non-option arguments, in order (deep-link candidates)
    std::vector<std::string> positionals;
};

enum class CliParseResult {
    Ok,          ///< Continue startup
    ExitSuccess, ///< --help or --version handled, exit 0
    ExitError    ///< Invalid arguments, exit 1
};

/**
 * @brief Parse command-line arguments
 *
 * Messages for help, version and errors are printed to stdout/stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 */
CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args);

/** @brief Same as parse_cli_args() for an argv held in a vector */
CliParseResult parse_cli_args(const std::vector<std::string>& argv, CliArgs& args);

/** @brief Whether the option is present in a (forwarded) argument list */
bool args_contain_flag(const std::vector<std::string>& argv, const char* flag);

} // namespace hackerai
