// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "hackerai_version.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>

namespace hackerai {

namespace {

void print_help(const char* program_name) {
    printf("Usage: %s [options] [hackerai://...]\n", program_name);
    printf("Options:\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  --config <path>      Settings file (default: "
           "$XDG_CONFIG_HOME/co.hackerai.desktop/settings.json)\n");
    printf("  --check-updates      Check for updates now and report the result\n");
    printf("  --no-update-check    Don't check for updates in the background\n");
    printf("  --no-register        Don't register as the hackerai:// link handler\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("\nA hackerai:// link given as argument is handed to the running instance\n");
    printf("(or to this one if none is running).\n");
    printf("\nEnvironment:\n");
    printf("  APP_URL                 App URL opened at startup\n");
    printf("  HACKERAI_ALLOWED_HOSTS  Comma-separated hosts allowed as login origin\n");
    printf("  HACKERAI_CONFIG_DIR     Directory holding settings.json\n");
    printf("  HACKERAI_DATA_DIR       Directory for logs and update state\n");
}

// Value of "--opt value" or "--opt=value"; advances i for the separate form
bool take_value(const std::vector<std::string>& argv, size_t& i, const char* opt,
                std::string& out) {
    const std::string& arg = argv[i];
    size_t opt_len = strlen(opt);
    if (arg.size() > opt_len && arg.compare(0, opt_len, opt) == 0 && arg[opt_len] == '=') {
        out = arg.substr(opt_len + 1);
        return true;
    }
    if (i + 1 < argv.size()) {
        out = argv[++i];
        return true;
    }
    fprintf(stderr, "Error: %s requires an argument\n", opt);
    return false;
}

bool matches_option(const std::string& arg, const char* opt) {
    size_t opt_len = strlen(opt);
    return arg == opt || (arg.size() > opt_len && arg.compare(0, opt_len, opt) == 0 &&
                          arg[opt_len] == '=');
}

} // namespace

CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args) {
    std::vector<std::string> list;
    list.reserve(argc > 0 ? static_cast<size_t>(argc) : 0);
    for (int i = 0; i < argc; i++) {
        list.emplace_back(argv[i] ? argv[i] : "");
    }
    return parse_cli_args(list, args);
}

CliParseResult parse_cli_args(const std::vector<std::string>& argv, CliArgs& args) {
    const char* program_name = argv.empty() ? "hackerai-desktop" : argv[0].c_str();
    bool options_done = false;

    for (size_t i = 1; i < argv.size(); i++) {
        const std::string& arg = argv[i];

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            args.positionals.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
        }
        // Verbosity: -v, -vv, -vvv
        else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
                 arg.find_first_not_of('v', 1) == std::string::npos) {
            args.verbosity += static_cast<int>(arg.size() - 1);
        } else if (arg == "--verbose") {
            args.verbosity++;
        }
        // Log destination
        else if (matches_option(arg, "--log-dest")) {
            if (!take_value(argv, i, "--log-dest", args.log_dest)) {
                return CliParseResult::ExitError;
            }
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                fprintf(stderr, "Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                fprintf(stderr, "Valid values: auto, journal, syslog, file, console\n");
                return CliParseResult::ExitError;
            }
        } else if (matches_option(arg, "--log-file")) {
            if (!take_value(argv, i, "--log-file", args.log_file)) {
                return CliParseResult::ExitError;
            }
        } else if (matches_option(arg, "--config")) {
            if (!take_value(argv, i, "--config", args.config_path)) {
                return CliParseResult::ExitError;
            }
        }
        // Updates
        else if (arg == "--check-updates") {
            args.check_updates = true;
        } else if (arg == "--no-update-check") {
            args.no_update_check = true;
        } else if (arg == "--no-register") {
            args.no_register = true;
        }
        // Help
        else if (arg == "-h" || arg == "--help") {
            print_help(program_name);
            return CliParseResult::ExitSuccess;
        }
        // Version
        else if (arg == "-V" || arg == "--version") {
            printf("hackerai-desktop %s\n", version::current());
            return CliParseResult::ExitSuccess;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            fprintf(stderr, "Use --help for usage information\n");
            return CliParseResult::ExitError;
        }
    }

    if (!args.log_file.empty() && !args.log_dest.empty() && args.log_dest != "file") {
        spdlog::warn("[CliArgs] --log-file is ignored with --log-dest={}", args.log_dest);
    }

    return CliParseResult::Ok;
}

bool args_contain_flag(const std::vector<std::string>& argv, const char* flag) {
    for (size_t i = 1; i < argv.size(); i++) {
        if (argv[i] == "--") {
            break;
        }
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

} // namespace hackerai
