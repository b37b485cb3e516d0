// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace hackerai {

Config* Config::instance{NULL};

namespace {

constexpr const char* CONFIG_FILE_NAME = "settings.json";
constexpr const char* DEFAULT_APP_URL = "https://hackerai.co";
constexpr const char* DEFAULT_UPDATE_ENDPOINT =
    "https://hackerai.co/api/desktop/update/{{target}}/{{arch}}/{{current_version}}";
constexpr uint64_t DEFAULT_POLL_INTERVAL_SEC = 60 * 60;
constexpr uint64_t DEFAULT_CHECK_INTERVAL_SEC = 24 * 60 * 60;
constexpr uint64_t MAX_INTERVAL_SEC = 365 * 24 * 60 * 60;

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : "";
}

/// Fill in keys missing from data (recursively for objects)
/// @return true if anything was added
bool merge_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto& [key, value] : defaults.items()) {
        if (!data.contains(key)) {
            data[key] = value;
            modified = true;
        } else if (value.is_object() && data[key].is_object()) {
            modified |= merge_missing_defaults(data[key], value);
        }
    }
    return modified;
}

/// Reads an interval, treating zero/negative/garbage as "use default" and
/// capping it at one year so it always fits a millisecond duration
uint64_t positive_seconds(Config& cfg, const std::string& ptr, uint64_t fallback) {
    int64_t value = cfg.get<int64_t>(ptr, static_cast<int64_t>(fallback));
    if (value <= 0) {
        spdlog::warn("[Config] {} must be positive, using {}", ptr, fallback);
        return fallback;
    }
    if (static_cast<uint64_t>(value) > MAX_INTERVAL_SEC) {
        spdlog::warn("[Config] {} too large, capping at {}", ptr, MAX_INTERVAL_SEC);
        return MAX_INTERVAL_SEC;
    }
    return static_cast<uint64_t>(value);
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"app_url", DEFAULT_APP_URL},
            {"log_level", "warn"},
            {"log_dest", "auto"},
            {"updater",
             {{"enabled", true},
              {"endpoint", DEFAULT_UPDATE_ENDPOINT},
              {"poll_interval_sec", DEFAULT_POLL_INTERVAL_SEC},
              {"check_interval_sec", DEFAULT_CHECK_INTERVAL_SEC}}},
            {"webview", {{"launcher", "xdg-open"}}},
            {"deep_link", {{"register", true}}}};
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                parse_error = "top level is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_defaults(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    bool ok = true;
    if (config_modified) {
        ok = save();
    }

    spdlog::debug("[Config] initialized: app_url={}, updater={}", get_app_url(),
                  is_updater_enabled() ? "on" : "off");
    return ok;
}

std::string Config::get_path() {
    return path;
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    if (path.empty()) {
        spdlog::error("[Config] save() called before init()");
        return false;
    }

    std::error_code ec;
    fs::path dir = fs::path(path).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("[Config] Cannot create config directory {}: {}", dir.string(),
                          ec.message());
            return false;
        }
    }

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream o(tmp_path, std::ios::trunc);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }
        o << std::setw(2) << data << std::endl;
        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            o.close();
            fs::remove(tmp_path, ec);
            return false;
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("[Config] Failed to replace {}: {}", path, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

std::string Config::get_app_url() {
    std::string env_url = env_or_empty("APP_URL");
    if (!env_url.empty()) {
        return env_url;
    }
    return get<std::string>("/app_url", DEFAULT_APP_URL);
}

std::string Config::get_log_level() {
    return get<std::string>("/log_level", "warn");
}

std::string Config::get_log_dest() {
    return get<std::string>("/log_dest", "auto");
}

bool Config::is_updater_enabled() {
    return get<bool>("/updater/enabled", true);
}

std::string Config::get_update_endpoint() {
    return get<std::string>("/updater/endpoint", DEFAULT_UPDATE_ENDPOINT);
}

uint64_t Config::get_update_poll_interval_sec() {
    return positive_seconds(*this, "/updater/poll_interval_sec", DEFAULT_POLL_INTERVAL_SEC);
}

uint64_t Config::get_update_check_interval_sec() {
    return positive_seconds(*this, "/updater/check_interval_sec", DEFAULT_CHECK_INTERVAL_SEC);
}

std::string Config::get_webview_launcher() {
    return get<std::string>("/webview/launcher", "xdg-open");
}

bool Config::is_deep_link_registration_enabled() {
    return get<bool>("/deep_link/register", true);
}

std::string Config::resolve_config_path(const std::string& cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }

    std::string config_dir = env_or_empty("HACKERAI_CONFIG_DIR");
    if (!config_dir.empty()) {
        return (fs::path(config_dir) / CONFIG_FILE_NAME).string();
    }

    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (xdg.empty()) {
        std::string home = env_or_empty("HOME");
        xdg = home.empty() ? "." : home + "/.config";
    }
    return (fs::path(xdg) / APP_IDENTIFIER / CONFIG_FILE_NAME).string();
}

std::string Config::resolve_data_dir() {
    std::string data_dir = env_or_empty("HACKERAI_DATA_DIR");
    if (!data_dir.empty()) {
        return data_dir;
    }

    std::string xdg = env_or_empty("XDG_DATA_HOME");
    if (!xdg.empty()) {
        return (fs::path(xdg) / APP_IDENTIFIER).string();
    }

    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        return (fs::path(home) / ".local/share" / APP_IDENTIFIER).string();
    }
    return "";
}

} // namespace hackerai
