// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "image_reformat.h"

#include <algorithm>
#include <cmath>
#include <strings.h>

namespace vnav {

namespace {

int scaled(int value, double scale) {
    return std::max(1, static_cast<int>(std::lround(value * scale)));
}

} // namespace

bool parse_reformat_mode(const std::string& text, ReformatMode& out) {
    if (strcasecmp(text.c_str(), "FIT") == 0) {
        out = ReformatMode::FIT;
    } else if (strcasecmp(text.c_str(), "FILL") == 0) {
        out = ReformatMode::FILL;
    } else if (strcasecmp(text.c_str(), "DISTORT") == 0) {
        out = ReformatMode::DISTORT;
    } else if (strcasecmp(text.c_str(), "EXPANDING") == 0) {
        out = ReformatMode::EXPANDING;
    } else {
        return false;
    }
    return true;
}

const char* reformat_mode_name(ReformatMode mode) {
    switch (mode) {
    case ReformatMode::FIT:
        return "FIT";
    case ReformatMode::FILL:
        return "FILL";
    case ReformatMode::DISTORT:
        return "DISTORT";
    case ReformatMode::EXPANDING:
        return "EXPANDING";
    }
    return "FILL";
}

ReformatPlan compute_reformat(int src_width, int src_height, int canvas_width, int canvas_height,
                              ReformatMode mode) {
    ReformatPlan plan;
    if (src_width <= 0 || src_height <= 0 || canvas_width <= 0 || canvas_height <= 0) {
        return plan;
    }

    const double scale_x = static_cast<double>(canvas_width) / src_width;
    const double scale_y = static_cast<double>(canvas_height) / src_height;
    const PixelRect full_source{0, 0, src_width, src_height};

    switch (mode) {
    case ReformatMode::FIT: {
        const double scale = std::min(scale_x, scale_y);
        const int w = std::min(canvas_width, scaled(src_width, scale));
        const int h = std::min(canvas_height, scaled(src_height, scale));
        plan.out_width = canvas_width;
        plan.out_height = canvas_height;
        plan.source = full_source;
        plan.dest = {(canvas_width - w) / 2, (canvas_height - h) / 2, w, h};
        break;
    }
    case ReformatMode::FILL: {
        const double scale = std::max(scale_x, scale_y);
        const int crop_w = std::min(src_width, scaled(canvas_width, 1.0 / scale));
        const int crop_h = std::min(src_height, scaled(canvas_height, 1.0 / scale));
        plan.out_width = canvas_width;
        plan.out_height = canvas_height;
        plan.source = {(src_width - crop_w) / 2, (src_height - crop_h) / 2, crop_w, crop_h};
        plan.dest = {0, 0, canvas_width, canvas_height};
        break;
    }
    case ReformatMode::DISTORT:
        plan.out_width = canvas_width;
        plan.out_height = canvas_height;
        plan.source = full_source;
        plan.dest = {0, 0, canvas_width, canvas_height};
        break;
    case ReformatMode::EXPANDING:
        plan.out_width = scaled(src_width, scale_y);
        plan.out_height = canvas_height;
        plan.source = full_source;
        plan.dest = {0, 0, plan.out_width, canvas_height};
        break;
    }
    return plan;
}

} // namespace vnav
