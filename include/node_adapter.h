// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace vnav {

/// Inclusive (first, last) frame range as stored on a node
using NodeFrameRange = std::pair<int, int>;

/**
 * @brief Access to one host node holding a file path
 *
 * The navigation session only talks to nodes through this interface, so it
 * runs unchanged against a compositing host or the in-memory implementation.
 * All calls happen on the interactive thread.
 */
class NodeAdapter {
  public:
    virtual ~NodeAdapter() = default;

    /// Node name for log messages
    virtual std::string name() const = 0;

    /// Current file path (empty if the node has none)
    virtual std::string get_path_value() const = 0;
    virtual void set_path_value(const std::string& path) = 0;

    /// Frame range, or nullopt for nodes without one
    virtual std::optional<NodeFrameRange> get_frame_range() const = 0;
    virtual void set_frame_range(int first, int last) = 0;

    /// Show a directory to the user
    virtual void reveal_in_file_browser(const std::string& path) = 0;
};

} // namespace vnav
