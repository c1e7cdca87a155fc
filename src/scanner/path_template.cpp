// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "path_template.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <regex>

namespace vnav {

namespace {

// Version marker: the first group captures the digits
const std::regex VERSION_RE("[vV]([0-9]+)");

// "%04d" style padding: the first group captures the width
const std::regex PRINTF_RE("%0([0-9]{1,2})d");

// "####" style padding, at least 2 '#' to limit conflicts
const std::regex HASH_RE("#{2,}");

// Keeps stoi() in range
constexpr size_t MAX_VERSION_DIGITS = 9;

struct MarkerMatch {
    size_t pos;
    size_t length;
};

std::vector<MarkerMatch> find_markers(const std::string& path) {
    std::vector<MarkerMatch> markers;
    for (auto it = std::sregex_iterator(path.begin(), path.end(), VERSION_RE);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        size_t pos = static_cast<size_t>(m.position(0));

        // "dev2" is not a version: the letter must start a token
        if (pos > 0 && std::isalpha(static_cast<unsigned char>(path[pos - 1]))) {
            continue;
        }
        if (static_cast<size_t>(m.length(1)) > MAX_VERSION_DIGITS) {
            spdlog::trace("[PathTemplate] Ignoring oversized marker '{}' in {}", m.str(0), path);
            continue;
        }
        markers.push_back({pos, static_cast<size_t>(m.length(0))});
    }
    return markers;
}

size_t filename_offset(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? 0 : slash + 1;
}

} // namespace

std::optional<PathTemplate> PathTemplateParser::parse(const std::string& path,
                                                      const std::string& base_dir,
                                                      VersionError* error) {
    auto markers = find_markers(path);
    if (markers.empty()) {
        spdlog::debug("[PathTemplate] No version marker in '{}'", path);
        if (error) {
            *error = VersionError::no_version_token(path);
        }
        return std::nullopt;
    }

    PathTemplate tmpl;
    tmpl.source = path;
    tmpl.base_dir = base_dir;
    tmpl.resolved = resolve_path(path, base_dir);

    const MarkerMatch& last = markers.back();
    tmpl.version_pos = last.pos;
    tmpl.version_length = last.length;
    tmpl.version_width = static_cast<int>(last.length - 1);
    tmpl.version = std::stoi(path.substr(last.pos + 1, last.length - 1));

    const std::string marker = tmpl.marker_text();
    for (size_t i = 0; i + 1 < markers.size(); ++i) {
        if (path.compare(markers[i].pos, markers[i].length, marker) == 0) {
            tmpl.linked_positions.push_back(markers[i].pos);
        }
    }

    tmpl.in_directory = last.pos < filename_offset(path);
    tmpl.frame = find_frame_field(path);

    spdlog::trace("[PathTemplate] '{}' -> version {} (width {}, {} linked, dir={}, frame={})",
                  path, tmpl.version, tmpl.version_width, tmpl.linked_positions.size(),
                  tmpl.in_directory, tmpl.frame.present());
    return tmpl;
}

std::string PathTemplateParser::pad_number(int value, int width) {
    std::string digits = std::to_string(value < 0 ? 0 : value);
    if (static_cast<int>(digits.size()) < width) {
        digits.insert(0, static_cast<size_t>(width) - digits.size(), '0');
    }
    return digits;
}

std::string PathTemplateParser::build(const PathTemplate& tmpl, int version) {
    return build_with_digits(tmpl, pad_number(version, tmpl.version_width));
}

std::string PathTemplateParser::build_with_digits(const PathTemplate& tmpl,
                                                  const std::string& digits) {
    // Back to front so earlier offsets stay valid
    std::string result = tmpl.source;
    const size_t digits_len = tmpl.version_length - 1;
    result.replace(tmpl.version_pos + 1, digits_len, digits);
    for (auto it = tmpl.linked_positions.rbegin(); it != tmpl.linked_positions.rend(); ++it) {
        result.replace(*it + 1, digits_len, digits);
    }
    return result;
}

std::string PathTemplateParser::resolve(const PathTemplate& tmpl, const std::string& source_form) {
    return resolve_path(source_form, tmpl.base_dir);
}

std::string PathTemplateParser::resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || path[0] == '/' || base_dir.empty()) {
        return path;
    }
    std::string base = base_dir;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    if (base == "/") {
        return base + path;
    }
    return base + "/" + path;
}

FrameField PathTemplateParser::find_frame_field(const std::string& path) {
    FrameField field;
    const size_t name_start = filename_offset(path);
    const auto name_begin = path.begin() + static_cast<std::ptrdiff_t>(name_start);

    for (auto it = std::sregex_iterator(name_begin, path.end(), PRINTF_RE);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        field.kind = FrameFieldKind::PRINTF;
        field.offset = name_start + static_cast<size_t>(m.position(0));
        field.length = static_cast<size_t>(m.length(0));
        field.width = std::stoi(m.str(1));
    }
    if (field.present()) {
        return field;
    }

    for (auto it = std::sregex_iterator(name_begin, path.end(), HASH_RE);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        field.kind = FrameFieldKind::HASH;
        field.offset = name_start + static_cast<size_t>(m.position(0));
        field.length = static_cast<size_t>(m.length(0));
        field.width = static_cast<int>(field.length);
    }
    return field;
}

std::string PathTemplateParser::frame_path(const std::string& path, int frame) {
    FrameField field = find_frame_field(path);
    if (!field.present()) {
        return path;
    }
    std::string result = path;
    result.replace(field.offset, field.length, pad_number(frame, field.width));
    return result;
}

} // namespace vnav
