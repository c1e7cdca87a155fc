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

Config* Config::instance{NULL};

namespace {

/// Add every key of `defaults` missing from `target`, recursing into objects
/// @return true if anything was added
bool merge_missing_defaults(json& target, const json& defaults) {
    bool modified = false;
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        } else if (value.is_object() && target[key].is_object()) {
            if (merge_missing_defaults(target[key], value)) {
                modified = true;
            }
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_defaults() {
    return {{"log_level", "info"},
            {"log_target", "console"},
            {"log_path", ""},
            {"session",
             {{"thumb_enabled", true},
              {"thumb_reformat", "FILL"},
              {"thumb_frame_mode", "middle"},
              {"change_range", true},
              {"set_missing", false},
              {"preview_enabled", true}}},
            {"thumbnail",
             {{"width", 192}, {"height", 108}, {"cache_capacity", 64}, {"worker_threads", 2}}}};
}

std::string Config::default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/vnav/vnavconfig.json";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.config/vnav/vnavconfig.json";
    }
    return "vnavconfig.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        // Load existing config
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_defaults();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] {} is not a JSON object, resetting to defaults", config_path);
            data = get_defaults();
            config_modified = true;
        }
    } else {
        // Create default config
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_defaults();
        config_modified = true;

        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty()) {
            try {
                fs::create_directories(config_dir);
            } catch (const fs::filesystem_error& e) {
                spdlog::warn("[Config] Failed to create config directory {}: {}",
                             config_dir.string(), e.what());
            }
        }
    }

    // Ensure every section exists with defaults
    if (merge_missing_defaults(data, get_defaults())) {
        config_modified = true;
    }

    // Save updated config with any new defaults
    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with unsaved defaults");
    }

    spdlog::debug("[Config] Initialized from {}", config_path);
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::debug("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::debug("[Config] Config saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}
