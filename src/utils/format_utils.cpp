// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <cstdio>
#include <regex>

namespace vnav::format {

namespace {

void append_part(std::string& out, const std::string& sep, int start, int end) {
    if (!out.empty()) {
        out += sep;
    }
    char buf[32];
    if (start == end) {
        std::snprintf(buf, sizeof(buf), "%d", start);
    } else {
        std::snprintf(buf, sizeof(buf), "%d-%d", start, end);
    }
    out += buf;
}

} // namespace

// =============================================================================
// Frame Lists
// =============================================================================

std::string format_frames(const std::vector<int>& frames, const std::string& sep) {
    std::string out;
    if (frames.empty()) {
        return out;
    }

    int start = frames.front();
    int end = start;
    for (size_t i = 1; i < frames.size(); ++i) {
        if (frames[i] == end + 1) {
            end = frames[i];
        } else {
            append_part(out, sep, start, end);
            start = end = frames[i];
        }
    }
    append_part(out, sep, start, end);
    return out;
}

std::string format_frame_range(int first, int last,
                               const std::vector<std::pair<int, int>>& gaps) {
    std::string out;
    if (last < first) {
        return out;
    }

    // Next frame not yet covered by output or a gap
    long long start = first;
    for (const auto& gap : gaps) {
        if (gap.second < start || gap.first > last) {
            continue;
        }
        if (gap.first > start) {
            append_part(out, " ", static_cast<int>(start), gap.first - 1);
        }
        start = static_cast<long long>(gap.second) + 1;
    }
    if (start <= last) {
        append_part(out, " ", static_cast<int>(start), last);
    }
    return out;
}

// =============================================================================
// Sequence Strings
// =============================================================================

SequenceSpec strip_sequence(const std::string& sequence) {
    static const std::regex RANGE_RE("\\s([0-9]{1,9})-([0-9]{1,9})$");

    SequenceSpec spec;
    std::smatch m;
    if (std::regex_search(sequence, m, RANGE_RE)) {
        spec.path = sequence.substr(0, static_cast<size_t>(m.position(0)));
        spec.first = std::stoi(m.str(1));
        spec.last = std::stoi(m.str(2));
    } else {
        spec.path = sequence;
    }
    return spec;
}

// =============================================================================
// Text
// =============================================================================

std::string elide_middle(const std::string& text, size_t width) {
    if (text.size() <= width) {
        return text + std::string(width - text.size(), ' ');
    }

    // Too narrow for the " ... " marker
    if (width < 7) {
        return text.substr(0, width);
    }

    const size_t head = width / 2 - 3;
    const size_t tail = (width + 1) / 2 - 2;
    return text.substr(0, head) + " ... " + text.substr(text.size() - tail);
}

} // namespace vnav::format
