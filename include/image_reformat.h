// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

/**
 * @file image_reformat.h
 * @brief Geometric mapping of a source image onto the preview canvas
 *
 * Pure functions, no pixel access. The thumbnail generator asks for a plan
 * and then resamples `source` into `dest` of an `out_width` x `out_height`
 * buffer pre-filled with the background color.
 *
 * ```
 *   FIT        FILL        DISTORT     EXPANDING
 *  +------+   +------+    +------+    +----------+
 *  |:####:|   |######|    |######|    |##########|  canvas height kept,
 *  |:####:|   |######|    |######|    |##########|  width follows aspect
 *  +------+   +------+    +------+    +----------+
 *  bars       crop        stretch
 * ```
 */

namespace vnav {

enum class ReformatMode {
    FIT,      ///< Scale to fit inside the canvas, centered, background bars
    FILL,     ///< Scale to cover the canvas, centered crop
    DISTORT,  ///< Stretch to exactly the canvas size
    EXPANDING ///< Scale to the canvas height; width is unbounded
};

/// Parse "FIT" / "FILL" / "DISTORT" / "EXPANDING" (case-insensitive)
bool parse_reformat_mode(const std::string& text, ReformatMode& out);

const char* reformat_mode_name(ReformatMode mode);

struct PixelRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const PixelRect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

/**
 * @brief Result of compute_reformat()
 */
struct ReformatPlan {
    int out_width = 0;  ///< Width of the produced image
    int out_height = 0; ///< Height of the produced image
    PixelRect source;   ///< Region of the source image that is sampled
    PixelRect dest;     ///< Region of the output it is resampled into

    bool valid() const {
        return out_width > 0 && out_height > 0 && source.width > 0 && source.height > 0 &&
               dest.width > 0 && dest.height > 0;
    }
};

/**
 * @brief Map a source image onto a canvas
 *
 * @param src_width Source width in pixels
 * @param src_height Source height in pixels
 * @param canvas_width Preview canvas width
 * @param canvas_height Preview canvas height
 * @param mode Reformat mode
 * @return Plan; invalid (all zero) when any dimension is not positive
 */
ReformatPlan compute_reformat(int src_width, int src_height, int canvas_width, int canvas_height,
                              ReformatMode mode);

} // namespace vnav
