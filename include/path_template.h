// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "version_error.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @file path_template.h
 * @brief Version and frame field extraction from media paths
 *
 * A PathTemplate is a media path with its version marker ("v003") abstracted
 * so sibling versions can be enumerated and substituted:
 *
 * ```
 *   /shots/010/render_v003/shot_v003.%04d.exr
 *              ^^^^^^^^^^^      ^^^^ ^^^^
 *              linked marker    |    frame field (PRINTF, width 4)
 *                               designated marker (last one wins)
 * ```
 *
 * Earlier markers whose text is identical to the designated one are "linked"
 * and rewritten together with it.
 */

namespace vnav {

/**
 * @brief Notation used for the frame number in a sequence path
 */
enum class FrameFieldKind {
    NONE,  ///< Not a sequence
    HASH,  ///< "####" (two or more '#')
    PRINTF ///< "%04d"
};

/**
 * @brief Location of the frame field inside one concrete path string
 */
struct FrameField {
    FrameFieldKind kind = FrameFieldKind::NONE;
    size_t offset = 0; ///< Offset of the token in the path string
    size_t length = 0; ///< Length of the token text ("%04d" -> 4, "####" -> 4)
    int width = 0;     ///< Zero-padding width of the expanded frame number

    bool present() const {
        return kind != FrameFieldKind::NONE;
    }
};

/**
 * @brief A media path with its designated version field located
 *
 * Offsets refer to `source` (the path exactly as given, possibly relative).
 * `resolved` is `source` joined to `base_dir` when relative; the marker text
 * always lives in the `source` portion, so resolved offsets are
 * `offset + resolved_shift()`.
 */
struct PathTemplate {
    std::string source;   ///< Path as given
    std::string resolved; ///< Absolute form used for file system access
    std::string base_dir; ///< Directory relative paths are resolved against

    size_t version_pos = 0;    ///< Offset of the marker letter ('v' or 'V')
    size_t version_length = 0; ///< Marker length including the letter
    int version_width = 0;     ///< Number of digits in the marker
    int version = 0;           ///< Parsed version number

    std::vector<size_t> linked_positions; ///< Earlier identical markers, ascending
    bool in_directory = false;            ///< Designated marker lies in a directory segment
    FrameField frame;                     ///< Frame field of `source`, if any

    /// Full marker text, e.g. "v003"
    std::string marker_text() const {
        return source.substr(version_pos, version_length);
    }

    /// Marker letter as written ('v' or 'V')
    char marker_letter() const {
        return source[version_pos];
    }

    size_t resolved_shift() const {
        return resolved.size() - source.size();
    }

    bool has_frame_field() const {
        return frame.present();
    }
};

/**
 * @brief Parses and rewrites versioned media paths
 *
 * All functions are pure string operations; nothing here touches the disk.
 */
class PathTemplateParser {
  public:
    /**
     * @brief Locate the version marker of a path
     *
     * Searches for "v" followed by one or more digits (either case) that is
     * not preceded by a letter. The last marker in the path is designated.
     *
     * @param path Absolute path, or path relative to base_dir
     * @param base_dir Directory used to resolve relative paths
     * @param error Optional out-parameter, set to NO_VERSION_TOKEN on failure
     * @return Template, or nullopt if the path has no version marker
     */
    static std::optional<PathTemplate> parse(const std::string& path, const std::string& base_dir,
                                             VersionError* error = nullptr);

    /**
     * @brief Substitute a version number, zero-padded to the template width
     *
     * Operates on the source form, so relative paths stay relative.
     * `build(t, t.version) == t.source` for every parsed template.
     */
    static std::string build(const PathTemplate& tmpl, int version);

    /**
     * @brief Substitute an explicit digit string (keeps on-disk padding)
     */
    static std::string build_with_digits(const PathTemplate& tmpl, const std::string& digits);

    /**
     * @brief Convert a source-form path of this template to its absolute form
     */
    static std::string resolve(const PathTemplate& tmpl, const std::string& source_form);

    /**
     * @brief Join a possibly relative path to a base directory
     */
    static std::string resolve_path(const std::string& path, const std::string& base_dir);

    /**
     * @brief Find the frame field in the filename part of a path
     *
     * The last "%0Nd" wins; when there is none, the last run of two or more
     * '#'. Directory segments are never searched.
     */
    static FrameField find_frame_field(const std::string& path);

    /**
     * @brief Replace the frame field of a path by a concrete frame
     *
     * ex: "name.####.jpg", 7 -> "name.0007.jpg"
     * Paths without a frame field are returned unchanged.
     */
    static std::string frame_path(const std::string& path, int frame);

    /// Zero-pad a non-negative number to at least `width` digits
    static std::string pad_number(int value, int width);
};

} // namespace vnav
