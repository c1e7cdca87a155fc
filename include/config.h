// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __VNAV_CONFIG_H__
#define __VNAV_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages vnav configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from the interactive thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_config_path());
 *
 * // Get with default fallback
 * int capacity = cfg->get<int>("/thumbnail/cache_capacity", 64);
 *
 * // Set and save
 * cfg->set<std::string>("/session/thumb_reformat", "FIT");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults if it doesn't exist.
     * Missing keys are filled in from the defaults and the file is written
     * back when anything changed. A corrupt file is renamed to
     * `<path>.corrupt` and replaced by the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * Throws nlohmann::json::exception if path doesn't exist.
     * Use the overload with default_value for safer access.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/session/change_range")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Safe accessor that returns default_value if path doesn't exist.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/thumbnail/width")
     * @param default_value Fallback value if path not found
     * @return Configuration value or default_value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     *
     * @tparam T Value type to store
     * @param json_ptr JSON pointer path (e.g., "/session/preview_enabled")
     * @param v Value to set
     * @return The value that was set
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path
     *
     * Returns mutable reference to JSON object for complex operations.
     *
     * @param json_path JSON pointer path
     * @return Reference to JSON object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Writes in-memory config to disk with two-space indentation.
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /**
     * @brief Get configuration file path
     *
     * @return Path to the loaded configuration file
     */
    std::string get_path();

    /**
     * @brief Default configuration, as written to a new file
     */
    static json get_defaults();

    /**
     * @brief Default configuration file location
     *
     * `$XDG_CONFIG_HOME/vnav/vnavconfig.json`, falling back to
     * `$HOME/.config/vnav/vnavconfig.json`, then to `vnavconfig.json`.
     */
    static std::string default_config_path();

    /**
     * @brief Get singleton instance
     *
     * @return Pointer to global Config instance
     */
    static Config* get_instance();
};

#endif // __VNAV_CONFIG_H__
