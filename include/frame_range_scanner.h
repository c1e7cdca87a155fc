// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "directory_listing_cache.h"
#include "version_error.h"

#include <string>
#include <utility>
#include <vector>

namespace vnav {

/// Inclusive run of frames, used for the holes of a sequence
using FrameGap = std::pair<int, int>;

/**
 * @brief Inclusive frame span of an image sequence and its gaps
 *
 * A default-constructed range is empty, which is how still images and
 * sequences without any frame on disk are represented. Gaps are sorted,
 * disjoint and strictly inside [first, last], so their size does not depend
 * on how far apart the frames on disk are.
 */
struct FrameRange {
    int first = 0;
    int last = -1;
    std::vector<FrameGap> gaps; ///< Runs of frames in [first, last] not found on disk

    bool empty() const {
        return last < first;
    }

    /// Number of frames in [first, last] not found on disk
    long long missing_count() const {
        long long count = 0;
        for (const auto& gap : gaps) {
            count += static_cast<long long>(gap.second) - gap.first + 1;
        }
        return count;
    }

    /// Number of frames actually present
    long long present_count() const {
        if (empty()) {
            return 0;
        }
        return (static_cast<long long>(last) - first + 1) - missing_count();
    }

    bool operator==(const FrameRange& other) const {
        if (empty() || other.empty()) {
            return empty() == other.empty();
        }
        return first == other.first && last == other.last && gaps == other.gaps;
    }
    bool operator!=(const FrameRange& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Which frame of a sequence represents it in previews
 */
enum class FrameMode { FIRST, MIDDLE, LAST };

/// Parse "first" / "middle" / "last" (case-insensitive)
bool parse_frame_mode(const std::string& text, FrameMode& out);

const char* frame_mode_name(FrameMode mode);

/**
 * @brief Frame of `range` selected by `mode`
 *
 * MIDDLE is `first + (last - first) / 2`. Returns 0 for an empty range.
 */
int select_frame(const FrameRange& range, FrameMode mode);

/**
 * @brief Determines the frame range of a sequence path from disk
 *
 * Listings come from the shared DirectoryListingCache. Listing failures never
 * propagate: they produce an empty range and a recorded warning.
 */
class FrameRangeScanner {
  public:
    explicit FrameRangeScanner(DirectoryListingCache& listings);

    /**
     * @brief Scan the frames of a concrete path
     *
     * @param path Absolute path with a "####" or "%04d" frame field
     * @return Frame range (empty for paths without a frame field)
     */
    FrameRange scan(const std::string& path);

    /**
     * @brief Sorted frame numbers present on disk for a sequence path
     *
     * Does not record warnings.
     *
     * @param path Absolute sequence path
     * @param error Set to the listing error, if any (may be null)
     */
    std::vector<int> list_frames(const std::string& path, std::string* error = nullptr);

    /// IO_ERROR entries for sequence directories that could not be listed
    const std::vector<VersionError>& warnings() const {
        return warnings_;
    }

    void clear_warnings() {
        warnings_.clear();
    }

  private:
    DirectoryListingCache& listings_;
    std::vector<VersionError> warnings_;
};

} // namespace vnav
