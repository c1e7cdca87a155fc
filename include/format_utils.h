// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vnav::format {

// =============================================================================
// Constants
// =============================================================================

/**
 * @brief Unavailable/unknown value placeholder
 *
 * Use this constant for consistent display of unavailable data.
 * Example: modification date of a version that cannot be read.
 */
inline constexpr const char* UNAVAILABLE = "n/a";

// =============================================================================
// Frame Lists
// =============================================================================

/**
 * @brief Compact a sorted frame list into sub-ranges
 *
 * Consecutive frames are joined, steps are not detected:
 * {1, 2, 3, 4, 6, 8, 9, 10} -> "1-4 6 8-10"
 *
 * @param frames Ascending frame numbers
 * @param sep Separator between sub-ranges
 * @return Formatted string (empty for no frames)
 */
std::string format_frames(const std::vector<int>& frames, const std::string& sep = " ");

/**
 * @brief Format an inclusive range with gaps, same output as format_frames()
 *
 * Works from the gap list alone, so the cost does not grow with the span.
 * ex: (1, 10, {{5, 5}, {7, 7}}) -> "1-4 6 8-10"
 *
 * @param first First frame
 * @param last Last frame (a range with last < first is empty)
 * @param gaps Sorted, disjoint inclusive runs of frames that are not present
 */
std::string format_frame_range(int first, int last,
                               const std::vector<std::pair<int, int>>& gaps);

// =============================================================================
// Sequence Strings
// =============================================================================

/**
 * @brief Result of strip_sequence()
 */
struct SequenceSpec {
    std::string path;
    std::optional<int> first;
    std::optional<int> last;
};

/**
 * @brief Split a trailing " first-last" range off a sequence string
 *
 * ex: "name.####.jpg 1-10" -> {"name.####.jpg", 1, 10}
 * Strings without a trailing range are returned whole with no frames.
 */
SequenceSpec strip_sequence(const std::string& sequence);

// =============================================================================
// Text
// =============================================================================

/**
 * @brief Shorten text to exactly `width` characters by cutting its middle
 *
 * ex: ("/my/looooooooooooooooooong/path.png", 24) -> "/my/loooo ... g/path.png"
 * Shorter text is right-padded with spaces to `width`.
 */
std::string elide_middle(const std::string& text, size_t width);

} // namespace vnav::format
