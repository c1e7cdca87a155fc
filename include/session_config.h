// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "frame_range_scanner.h"
#include "image_reformat.h"
#include "node_sort.h"
#include "thumbnail_generator.h"

#include <cstddef>

class Config;

namespace vnav {

/**
 * @brief Thumbnail cache sizing, from the "/thumbnail" config section
 */
struct ThumbnailSettings {
    ThumbnailCanvas canvas;
    size_t cache_capacity = 64;
    int worker_threads = 2;
};

/**
 * @brief Options of one navigation session
 *
 * Everything except the sort key function comes from the "/session" and
 * "/thumbnail" config sections; the host supplies `node_sort_key_fct`
 * directly.
 */
struct SessionConfig {
    bool thumb_enabled = true;                         ///< Request previews while navigating
    ReformatMode thumb_reformat = ReformatMode::FILL;  ///< Canvas mapping of previews
    FrameMode thumb_frame_mode = FrameMode::MIDDLE;    ///< Previewed frame of a sequence
    bool change_range = true;                          ///< Push frame ranges with paths
    bool set_missing = false;                          ///< Write the version into nodes lacking it
    bool preview_enabled = true;                       ///< Initial live preview flag
    SortKeyFunction node_sort_key_fct;                 ///< Null for selection order
    ThumbnailSettings thumbnail;

    /**
     * @brief Read the typed options from a loaded Config
     *
     * Values of the wrong type and unknown enum strings keep their default
     * and log a warning.
     */
    static SessionConfig from_config(Config& config);

    /**
     * @brief Store the options the dialog lets the user change
     *
     * Writes preview_enabled, thumb_enabled, change_range, set_missing and
     * thumb_reformat back to `config` (in memory; the caller saves).
     */
    void store_preferences(Config& config) const;
};

} // namespace vnav
