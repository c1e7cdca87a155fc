// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "directory_listing_cache.h"
#include "frame_range_scanner.h"
#include "path_template.h"
#include "version_error.h"

#include <string>
#include <vector>

namespace vnav {

/**
 * @brief One version of a path template found on disk
 */
struct VersionEntry {
    int version = 0;
    std::string digits;      ///< Digit string as written on disk ("003")
    std::string path;        ///< Absolute path of this version
    std::string source_path; ///< Same path in the template's original form
    bool exists = false;     ///< false for synthesized entries

    bool operator==(const VersionEntry& other) const {
        return version == other.version && path == other.path && exists == other.exists;
    }
    bool operator!=(const VersionEntry& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Direction of a navigation step
 */
enum class NavDirection { NEXT, PREV, MIN, MAX };

const char* nav_direction_name(NavDirection direction);

/**
 * @brief Enumerates the sibling versions of a path template
 *
 * Listing starts in the directory holding the highest marker (linked or
 * designated) and descends through every segment down to the designated
 * one, so `render_v001/shot_v001.exr` finds `render_v002/shot_v002.exr`.
 * All markers of one version must carry the same digits. Directories are
 * read once per session through the shared DirectoryListingCache. Results
 * are sorted by version number and unique per number.
 */
class VersionSetResolver {
  public:
    explicit VersionSetResolver(DirectoryListingCache& listings);

    /**
     * @brief List the versions available on disk
     *
     * A directory that cannot be listed yields an empty set and a warning.
     */
    std::vector<VersionEntry> resolve(const PathTemplate& tmpl);

    /**
     * @brief Step through a version set
     *
     * NEXT/PREV move to the adjacent version and clamp at the ends. MIN/MAX
     * jump to the ends. An empty set returns `current` unchanged.
     */
    static VersionEntry navigate(const std::vector<VersionEntry>& entries,
                                 const VersionEntry& current, NavDirection direction);

    /**
     * @brief Entry for the template's own version
     *
     * Taken from `entries` when present, otherwise synthesized from the
     * template with `exists == false`.
     */
    static VersionEntry current_entry(const PathTemplate& tmpl,
                                      const std::vector<VersionEntry>& entries);

    /**
     * @brief Modification date of a version as "YYYY-MM-DD HH:MM"
     *
     * Sequences use their last frame. Returns "n/a" when nothing can be read.
     */
    static std::string format_date(const VersionEntry& entry, const FrameRange& range);

    /// IO_ERROR entries for version directories that could not be listed
    const std::vector<VersionError>& warnings() const {
        return warnings_;
    }

    void clear_warnings() {
        warnings_.clear();
    }

  private:
    bool remainder_exists(const std::string& path);

    DirectoryListingCache& listings_;
    FrameRangeScanner frames_;
    std::vector<VersionError> warnings_;
};

} // namespace vnav
