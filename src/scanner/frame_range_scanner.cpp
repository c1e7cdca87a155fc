// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "frame_range_scanner.h"

#include "path_template.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <strings.h>

namespace vnav {

namespace {

// Frame numbers above this cannot be parsed safely
constexpr size_t MAX_FRAME_DIGITS = 9;

bool all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

bool parse_frame_mode(const std::string& text, FrameMode& out) {
    if (strcasecmp(text.c_str(), "first") == 0) {
        out = FrameMode::FIRST;
    } else if (strcasecmp(text.c_str(), "middle") == 0) {
        out = FrameMode::MIDDLE;
    } else if (strcasecmp(text.c_str(), "last") == 0) {
        out = FrameMode::LAST;
    } else {
        return false;
    }
    return true;
}

const char* frame_mode_name(FrameMode mode) {
    switch (mode) {
    case FrameMode::FIRST:
        return "first";
    case FrameMode::MIDDLE:
        return "middle";
    case FrameMode::LAST:
        return "last";
    }
    return "middle";
}

int select_frame(const FrameRange& range, FrameMode mode) {
    if (range.empty()) {
        return 0;
    }
    switch (mode) {
    case FrameMode::FIRST:
        return range.first;
    case FrameMode::LAST:
        return range.last;
    case FrameMode::MIDDLE:
        break;
    }
    return range.first + (range.last - range.first) / 2;
}

FrameRangeScanner::FrameRangeScanner(DirectoryListingCache& listings) : listings_(listings) {}

std::vector<int> FrameRangeScanner::list_frames(const std::string& path, std::string* error) {
    std::vector<int> frames;
    const FrameField field = PathTemplateParser::find_frame_field(path);
    if (!field.present()) {
        return frames;
    }

    const size_t slash = path.find_last_of('/');
    const std::string dir = slash == std::string::npos ? "" : path.substr(0, slash);
    const size_t name_start = slash == std::string::npos ? 0 : slash + 1;
    const std::string prefix = path.substr(name_start, field.offset - name_start);
    const std::string suffix = path.substr(field.offset + field.length);
    const size_t width = static_cast<size_t>(field.width);

    auto listing = listings_.list(dir.empty() && slash == 0 ? "/" : dir);
    if (!listing->ok) {
        if (error) {
            *error = listing->error;
        }
        return frames;
    }

    for (const auto& name : listing->names) {
        if (name.size() < prefix.size() + suffix.size() + width) {
            continue;
        }
        if (name.compare(0, prefix.size(), prefix) != 0 ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        const std::string digits =
            name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
        if (!all_digits(digits) || digits.size() > MAX_FRAME_DIGITS) {
            continue;
        }
        // Wider than declared: only an overflowing frame number, never extra padding
        if (digits.size() > width && digits[0] == '0') {
            continue;
        }
        frames.push_back(std::stoi(digits));
    }

    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
    return frames;
}

FrameRange FrameRangeScanner::scan(const std::string& path) {
    FrameRange range;
    if (!PathTemplateParser::find_frame_field(path).present()) {
        spdlog::trace("[FrameRangeScanner] No frame field in {}", path);
        return range;
    }

    std::string error;
    const std::vector<int> frames = list_frames(path, &error);
    if (!error.empty()) {
        const size_t slash = path.find_last_of('/');
        std::string dir = slash == std::string::npos ? path : path.substr(0, slash);
        if (slash == 0) {
            dir = "/";
        }
        spdlog::warn("[FrameRangeScanner] Cannot scan frames of {}: {}", path, error);
        warnings_.push_back(VersionError::io_error(dir, error));
        return range;
    }
    if (frames.empty()) {
        spdlog::debug("[FrameRangeScanner] No frame on disk for {}", path);
        return range;
    }

    range.first = frames.front();
    range.last = frames.back();
    for (size_t i = 1; i < frames.size(); ++i) {
        if (frames[i] - frames[i - 1] > 1) {
            range.gaps.emplace_back(frames[i - 1] + 1, frames[i] - 1);
        }
    }

    spdlog::debug("[FrameRangeScanner] {} -> {}-{} ({} missing in {} gap(s))", path, range.first,
                  range.last, range.missing_count(), range.gaps.size());
    return range;
}

} // namespace vnav
