// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __HACKERAI_CONFIG_H__
#define __HACKERAI_CONFIG_H__

#include "spdlog/spdlog.h"

#include <cstdint>
#include <string>

#include "hv/json.hpp"

namespace hackerai {

using json = nlohmann::json;

/// Reverse-DNS application identifier, used for per-user directories
constexpr const char* APP_IDENTIFIER = "co.hackerai.desktop";

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages settings.json. Uses JSON pointer syntax (RFC 6901) for
 * nested value access. Missing keys are filled in from defaults on init()
 * and the file is rewritten when that changed anything.
 *
 * Thread safety: Not thread-safe. Initialized once at startup on the main
 * thread; background tasks receive copies of the values they need.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::resolve_config_path(""));
 *
 * std::string launcher = cfg->get<std::string>("/webview/launcher", "xdg-open");
 * cfg->set<bool>("/updater/enabled", false);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;

  protected:
    std::string path;
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults if it doesn't exist.
     * A corrupt file is moved aside to <path>.corrupt and replaced with
     * defaults.
     *
     * @param config_path Absolute path to settings.json
     * @return false if the file could not be written (values stay usable)
     */
    bool init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or of wrong type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path is missing or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        try {
            json::json_pointer ptr(json_ptr);
            if (data.contains(ptr)) {
                return data[ptr].template get<T>();
            }
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Ignoring invalid value at {}: {}", json_ptr, e.what());
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     *
     * @return true on success
     */
    bool save();

    std::string get_path();

    /// @name Typed accessors (defaults applied)
    /// @{

    /** @brief App URL opened at startup; $APP_URL wins over /app_url */
    std::string get_app_url();
    std::string get_log_level();
    std::string get_log_dest();
    bool is_updater_enabled();
    std::string get_update_endpoint();
    uint64_t get_update_poll_interval_sec();
    uint64_t get_update_check_interval_sec();
    std::string get_webview_launcher();
    bool is_deep_link_registration_enabled();

    /// @}

    /** @brief Complete default configuration */
    static json get_default_config();

    /**
     * @brief Locate settings.json
     *
     * cli_path if set, else $HACKERAI_CONFIG_DIR/settings.json, else
     * $XDG_CONFIG_HOME/<app-id>/settings.json (~/.config when unset).
     */
    static std::string resolve_config_path(const std::string& cli_path);

    /**
     * @brief Locate the per-user app data directory
     *
     * $HACKERAI_DATA_DIR, else $XDG_DATA_HOME/<app-id>, else
     * ~/.local/share/<app-id>. Empty when HOME is unset too.
     */
    static std::string resolve_data_dir();

    static Config* get_instance();
};

} // namespace hackerai

#endif // __HACKERAI_CONFIG_H__
