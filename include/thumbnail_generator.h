// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "image_reformat.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vnav {

/**
 * @brief Identifies one preview image
 *
 * `path` is the absolute version path, possibly still holding its frame
 * field; `frame` is substituted into it at generation time (ignored for
 * stills).
 */
struct ThumbnailKey {
    std::string path;
    int frame = 0;
    ReformatMode mode = ReformatMode::FILL;

    bool operator==(const ThumbnailKey& other) const {
        return path == other.path && frame == other.frame && mode == other.mode;
    }
    bool operator!=(const ThumbnailKey& other) const {
        return !(*this == other);
    }
};

struct ThumbnailKeyHash {
    size_t operator()(const ThumbnailKey& key) const {
        size_t h = std::hash<std::string>{}(key.path);
        h ^= std::hash<int>{}(key.frame) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<int>{}(static_cast<int>(key.mode)) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

/**
 * @brief Decoded preview pixels, tightly packed RGBA8888
 */
struct ThumbnailImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;
};

/**
 * @brief Fixed size of the preview area
 */
struct ThumbnailCanvas {
    int width = 192;
    int height = 108;
    uint32_t background = 0x000000FF; ///< RGBA, used for FIT bars
};

/**
 * @brief Result of one generation
 */
struct GenerateResult {
    bool success = false;
    std::shared_ptr<const ThumbnailImage> image; ///< Set on success
    std::string error;                           ///< Set on failure
};

/**
 * @brief Decode + reformat step run on the cache's worker threads
 *
 * Implementations must be safe to call concurrently for different keys.
 */
class IThumbnailGenerator {
  public:
    virtual ~IThumbnailGenerator() = default;

    virtual GenerateResult generate(const ThumbnailKey& key) = 0;
};

/**
 * @brief Default generator: stb_image decode, stb_image_resize resampling
 *
 * Reads any format stb_image supports (PNG, JPEG, TGA, BMP, PSD, GIF, HDR,
 * PIC, PNM). Other formats fail with stb's reason.
 */
class StbThumbnailGenerator : public IThumbnailGenerator {
  public:
    explicit StbThumbnailGenerator(const ThumbnailCanvas& canvas);

    GenerateResult generate(const ThumbnailKey& key) override;

    const ThumbnailCanvas& canvas() const {
        return canvas_;
    }

  private:
    ThumbnailCanvas canvas_;
};

} // namespace vnav
