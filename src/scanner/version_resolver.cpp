// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "version_resolver.h"

#include "format_utils.h"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

#include <algorithm>
#include <ctime>
#include <iterator>
#include <map>
#include <regex>

namespace vnav {

namespace {

constexpr size_t MAX_VERSION_DIGITS = 9;

std::string escape_regex(const std::string& text) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string parent_dir(const std::string& path) {
    const size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    return slash == 0 ? "/" : path.substr(0, slash);
}

std::string join_dir(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    return dir == "/" ? dir + name : dir + "/" + name;
}

/// A replaceable span of one path segment (offsets relative to the segment)
struct SegmentField {
    size_t offset;
    size_t length;
    bool is_version; ///< false for a frame field
};

/**
 * @brief One path segment between the highest marker and the designated one
 *
 * Segments without a marker are matched literally; the others are matched
 * against `pattern` with every marker captured.
 */
struct SegmentMatcher {
    std::string text;
    bool literal = true;
    std::regex pattern;
};

SegmentMatcher make_matcher(const std::string& segment, std::vector<SegmentField> fields) {
    SegmentMatcher matcher;
    matcher.text = segment;
    if (fields.empty()) {
        return matcher;
    }

    std::sort(fields.begin(), fields.end(),
              [](const SegmentField& a, const SegmentField& b) { return a.offset < b.offset; });
    std::string pattern;
    size_t cursor = 0;
    for (const auto& field : fields) {
        pattern += escape_regex(segment.substr(cursor, field.offset - cursor));
        pattern += field.is_version ? "([0-9]+)" : "[0-9]+";
        cursor = field.offset + field.length;
    }
    pattern += escape_regex(segment.substr(cursor));
    matcher.literal = false;
    matcher.pattern = std::regex(pattern);
    return matcher;
}

/**
 * @brief Digit string shared by every marker of a matched name
 *
 * @param inherited Digits already fixed by a higher segment (empty if none)
 * @return The digits, or empty when the markers disagree
 */
std::string agreed_digits(const std::smatch& m, const std::string& inherited) {
    const std::string digits = m.str(1);
    if (digits.size() > MAX_VERSION_DIGITS) {
        return "";
    }
    if (!inherited.empty() && digits != inherited) {
        return "";
    }
    for (size_t g = 2; g < m.size(); ++g) {
        if (m.str(g) != digits) {
            return "";
        }
    }
    return digits;
}

/// Walk the segments below `dir`, collecting the digit strings of complete matches
void collect_versions(DirectoryListingCache& listings, const std::vector<SegmentMatcher>& segments,
                      size_t level, const std::string& dir, const std::string& digits,
                      std::vector<std::string>& out) {
    if (level == segments.size()) {
        if (std::find(out.begin(), out.end(), digits) == out.end()) {
            out.push_back(digits);
        }
        return;
    }

    const SegmentMatcher& segment = segments[level];
    if (segment.literal) {
        collect_versions(listings, segments, level + 1, join_dir(dir, segment.text), digits, out);
        return;
    }

    auto listing = listings.list(dir);
    if (!listing->ok) {
        spdlog::trace("[VersionSetResolver] Skipping unreadable {}", dir);
        return;
    }
    for (const auto& name : listing->names) {
        std::smatch m;
        if (!std::regex_match(name, m, segment.pattern)) {
            continue;
        }
        const std::string agreed = agreed_digits(m, digits);
        if (agreed.empty()) {
            continue;
        }
        collect_versions(listings, segments, level + 1, join_dir(dir, name), agreed, out);
    }
}

} // namespace

const char* nav_direction_name(NavDirection direction) {
    switch (direction) {
    case NavDirection::NEXT:
        return "next";
    case NavDirection::PREV:
        return "prev";
    case NavDirection::MIN:
        return "min";
    case NavDirection::MAX:
        return "max";
    }
    return "unknown";
}

VersionSetResolver::VersionSetResolver(DirectoryListingCache& listings)
    : listings_(listings), frames_(listings) {}

std::vector<VersionEntry> VersionSetResolver::resolve(const PathTemplate& tmpl) {
    std::vector<VersionEntry> entries;

    const std::string& resolved = tmpl.resolved;
    const size_t shift = tmpl.resolved_shift();
    const size_t marker_pos = tmpl.version_pos + shift;

    // Markers in resolved coordinates, highest first
    std::vector<size_t> markers;
    for (size_t linked : tmpl.linked_positions) {
        markers.push_back(linked + shift);
    }
    markers.push_back(marker_pos);

    // Listing starts at the directory holding the highest marker segment and
    // ends with the designated marker segment
    const size_t top_slash = resolved.rfind('/', markers.front());
    const size_t top_start = top_slash == std::string::npos ? 0 : top_slash + 1;
    const size_t slash_after = resolved.find('/', marker_pos);
    const size_t last_end = slash_after == std::string::npos ? resolved.size() : slash_after;
    const std::string dir = top_slash == std::string::npos ? ""
                            : top_slash == 0               ? "/"
                                                           : resolved.substr(0, top_slash);

    std::vector<SegmentMatcher> segments;
    size_t seg_start = top_start;
    while (seg_start < last_end) {
        size_t seg_end = resolved.find('/', seg_start);
        if (seg_end == std::string::npos || seg_end > last_end) {
            seg_end = last_end;
        }

        std::vector<SegmentField> fields;
        for (size_t pos : markers) {
            if (pos >= seg_start && pos < seg_end) {
                fields.push_back({pos - seg_start + 1, tmpl.version_length - 1, true});
            }
        }
        if (seg_end == resolved.size() && tmpl.frame.present()) {
            fields.push_back({tmpl.frame.offset + shift - seg_start, tmpl.frame.length, false});
        }
        segments.push_back(
            make_matcher(resolved.substr(seg_start, seg_end - seg_start), std::move(fields)));
        seg_start = seg_end + 1;
    }

    auto listing = listings_.list(dir);
    if (!listing->ok) {
        spdlog::warn("[VersionSetResolver] Cannot list versions in '{}': {}", dir, listing->error);
        warnings_.push_back(VersionError::io_error(dir, listing->error));
        return entries;
    }

    std::vector<std::string> matches;
    collect_versions(listings_, segments, 0, dir, "", matches);

    // version -> digit string kept for it
    std::map<int, std::string> found;
    for (const auto& digits : matches) {
        const int version = std::stoi(digits);
        auto it = found.find(version);
        if (it == found.end()) {
            found.emplace(version, digits);
        } else if (it->second.size() != static_cast<size_t>(tmpl.version_width) &&
                   digits.size() == static_cast<size_t>(tmpl.version_width)) {
            it->second = digits;
        }
    }

    for (const auto& [version, digits] : found) {
        VersionEntry entry;
        entry.version = version;
        entry.digits = digits;
        entry.source_path = PathTemplateParser::build_with_digits(tmpl, digits);
        entry.path = PathTemplateParser::resolve(tmpl, entry.source_path);
        // The walk matched every segment down to the designated one
        entry.exists = tmpl.in_directory ? remainder_exists(entry.path) : true;
        entries.push_back(std::move(entry));
    }

    spdlog::debug("[VersionSetResolver] {} version(s) of '{}' under {}", entries.size(),
                  resolved.substr(top_start, last_end - top_start), dir);
    return entries;
}

bool VersionSetResolver::remainder_exists(const std::string& path) {
    if (PathTemplateParser::find_frame_field(path).present()) {
        return !frames_.list_frames(path).empty();
    }
    auto listing = listings_.list(parent_dir(path));
    if (!listing->ok) {
        return false;
    }
    const std::string name = path.substr(path.find_last_of('/') + 1);
    return std::binary_search(listing->names.begin(), listing->names.end(), name);
}

VersionEntry VersionSetResolver::navigate(const std::vector<VersionEntry>& entries,
                                          const VersionEntry& current, NavDirection direction) {
    if (entries.empty()) {
        return current;
    }

    switch (direction) {
    case NavDirection::MIN:
        return entries.front();
    case NavDirection::MAX:
        return entries.back();
    case NavDirection::NEXT: {
        auto it = std::upper_bound(
            entries.begin(), entries.end(), current.version,
            [](int version, const VersionEntry& entry) { return version < entry.version; });
        return it == entries.end() ? entries.back() : *it;
    }
    case NavDirection::PREV: {
        auto it = std::lower_bound(
            entries.begin(), entries.end(), current.version,
            [](const VersionEntry& entry, int version) { return entry.version < version; });
        return it == entries.begin() ? entries.front() : *std::prev(it);
    }
    }
    return current;
}

VersionEntry VersionSetResolver::current_entry(const PathTemplate& tmpl,
                                               const std::vector<VersionEntry>& entries) {
    for (const auto& entry : entries) {
        if (entry.version == tmpl.version) {
            return entry;
        }
    }

    VersionEntry entry;
    entry.version = tmpl.version;
    entry.digits = tmpl.source.substr(tmpl.version_pos + 1, tmpl.version_length - 1);
    entry.source_path = tmpl.source;
    entry.path = tmpl.resolved;
    entry.exists = false;
    return entry;
}

std::string VersionSetResolver::format_date(const VersionEntry& entry, const FrameRange& range) {
    std::string target = entry.path;
    if (PathTemplateParser::find_frame_field(target).present()) {
        if (range.empty()) {
            return format::UNAVAILABLE;
        }
        target = PathTemplateParser::frame_path(target, range.last);
    }

    struct stat file_stat;
    if (stat(target.c_str(), &file_stat) != 0) {
        return format::UNAVAILABLE;
    }

    std::tm tm_info{};
    if (localtime_r(&file_stat.st_mtime, &tm_info) == nullptr) {
        return format::UNAVAILABLE;
    }
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_info);
    return buf;
}

} // namespace vnav
