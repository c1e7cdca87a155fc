// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

// Define STB implementations in this compilation unit only
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "thumbnail_generator.h"

#include "path_template.h"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "stb_image.h"
#include "stb_image_resize.h"

namespace vnav {

// Safety limits to prevent memory exhaustion and integer overflow
static constexpr int MAX_SOURCE_DIMENSION = 8192;

StbThumbnailGenerator::StbThumbnailGenerator(const ThumbnailCanvas& canvas) : canvas_(canvas) {}

GenerateResult StbThumbnailGenerator::generate(const ThumbnailKey& key) {
    GenerateResult result;
    const std::string file = PathTemplateParser::frame_path(key.path, key.frame);

    // ========================================================================
    // Step 1: Decode with stb_image (always RGBA)
    // ========================================================================
    int src_width = 0, src_height = 0, src_channels = 0;
    unsigned char* src_pixels = stbi_load(file.c_str(), &src_width, &src_height, &src_channels, 4);
    if (!src_pixels) {
        result.error = std::string("Failed to decode ") + file + ": " + stbi_failure_reason();
        return result;
    }

    if (src_width > MAX_SOURCE_DIMENSION || src_height > MAX_SOURCE_DIMENSION) {
        stbi_image_free(src_pixels);
        result.error = "Source image too large (" + std::to_string(src_width) + "x" +
                       std::to_string(src_height) + ", max " +
                       std::to_string(MAX_SOURCE_DIMENSION) + ")";
        return result;
    }

    // ========================================================================
    // Step 2: Map the source onto the canvas
    // ========================================================================
    const ReformatPlan plan =
        compute_reformat(src_width, src_height, canvas_.width, canvas_.height, key.mode);
    if (!plan.valid()) {
        stbi_image_free(src_pixels);
        result.error = "Invalid canvas " + std::to_string(canvas_.width) + "x" +
                       std::to_string(canvas_.height);
        return result;
    }

    spdlog::trace("[StbThumbnailGenerator] {} {}x{} -> {}x{} ({})", file, src_width, src_height,
                  plan.out_width, plan.out_height, reformat_mode_name(key.mode));

    auto image = std::make_shared<ThumbnailImage>();
    image->width = plan.out_width;
    image->height = plan.out_height;
    image->pixels.resize(static_cast<size_t>(plan.out_width) * plan.out_height * 4);
    const uint8_t bg[4] = {static_cast<uint8_t>(canvas_.background >> 24),
                           static_cast<uint8_t>(canvas_.background >> 16),
                           static_cast<uint8_t>(canvas_.background >> 8),
                           static_cast<uint8_t>(canvas_.background)};
    for (size_t i = 0; i < image->pixels.size(); i += 4) {
        std::copy(bg, bg + 4, image->pixels.begin() + static_cast<std::ptrdiff_t>(i));
    }

    // ========================================================================
    // Step 3: Resample the source rect into the destination rect
    // ========================================================================
    const int src_stride = src_width * 4;
    const int out_stride = plan.out_width * 4;
    const unsigned char* src_origin =
        src_pixels + static_cast<size_t>(plan.source.y) * src_stride + plan.source.x * 4;
    unsigned char* out_origin = image->pixels.data() +
                                static_cast<size_t>(plan.dest.y) * out_stride + plan.dest.x * 4;

    int resize_result =
        stbir_resize_uint8(src_origin, plan.source.width, plan.source.height, src_stride, // input
                           out_origin, plan.dest.width, plan.dest.height, out_stride,     // output
                           4 // RGBA channels
        );

    stbi_image_free(src_pixels);

    if (!resize_result) {
        result.error = "Failed to resize " + file;
        return result;
    }

    result.success = true;
    result.image = std::move(image);
    return result;
}

} // namespace vnav
