// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_config.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vnav {

namespace {

template <typename T> T read_option(Config& config, const std::string& json_ptr, const T& fallback) {
    try {
        return config.get<T>(json_ptr, fallback);
    } catch (const json::exception& e) {
        spdlog::warn("[SessionConfig] Invalid value at {}: {}", json_ptr, e.what());
        return fallback;
    }
}

} // namespace

SessionConfig SessionConfig::from_config(Config& config) {
    SessionConfig cfg;

    cfg.thumb_enabled = read_option<bool>(config, "/session/thumb_enabled", cfg.thumb_enabled);
    cfg.change_range = read_option<bool>(config, "/session/change_range", cfg.change_range);
    cfg.set_missing = read_option<bool>(config, "/session/set_missing", cfg.set_missing);
    cfg.preview_enabled =
        read_option<bool>(config, "/session/preview_enabled", cfg.preview_enabled);

    const std::string reformat = read_option<std::string>(
        config, "/session/thumb_reformat", reformat_mode_name(cfg.thumb_reformat));
    if (!parse_reformat_mode(reformat, cfg.thumb_reformat)) {
        spdlog::warn("[SessionConfig] Unknown thumb_reformat '{}', using {}", reformat,
                     reformat_mode_name(cfg.thumb_reformat));
    }

    const std::string frame_mode = read_option<std::string>(
        config, "/session/thumb_frame_mode", frame_mode_name(cfg.thumb_frame_mode));
    if (!parse_frame_mode(frame_mode, cfg.thumb_frame_mode)) {
        spdlog::warn("[SessionConfig] Unknown thumb_frame_mode '{}', using {}", frame_mode,
                     frame_mode_name(cfg.thumb_frame_mode));
    }

    ThumbnailSettings& thumb = cfg.thumbnail;
    thumb.canvas.width = read_option<int>(config, "/thumbnail/width", thumb.canvas.width);
    thumb.canvas.height = read_option<int>(config, "/thumbnail/height", thumb.canvas.height);
    if (thumb.canvas.width <= 0 || thumb.canvas.height <= 0) {
        spdlog::warn("[SessionConfig] Invalid thumbnail size {}x{}, using 192x108",
                     thumb.canvas.width, thumb.canvas.height);
        thumb.canvas.width = 192;
        thumb.canvas.height = 108;
    }
    const int capacity = read_option<int>(config, "/thumbnail/cache_capacity",
                                          static_cast<int>(thumb.cache_capacity));
    thumb.cache_capacity = static_cast<size_t>(std::max(capacity, 1));
    thumb.worker_threads =
        std::max(read_option<int>(config, "/thumbnail/worker_threads", thumb.worker_threads), 1);

    spdlog::debug("[SessionConfig] preview={}, thumbs={} ({}, {}), change_range={}, set_missing={}",
                  cfg.preview_enabled, cfg.thumb_enabled, reformat_mode_name(cfg.thumb_reformat),
                  frame_mode_name(cfg.thumb_frame_mode), cfg.change_range, cfg.set_missing);
    return cfg;
}

void SessionConfig::store_preferences(Config& config) const {
    config.set<bool>("/session/preview_enabled", preview_enabled);
    config.set<bool>("/session/thumb_enabled", thumb_enabled);
    config.set<bool>("/session/change_range", change_range);
    config.set<bool>("/session/set_missing", set_missing);
    config.set<std::string>("/session/thumb_reformat", reformat_mode_name(thumb_reformat));
}

} // namespace vnav
