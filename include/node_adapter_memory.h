// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "node_adapter.h"

#include <functional>
#include <string>
#include <vector>

namespace vnav {

/**
 * @brief NodeAdapter backed by plain member values
 *
 * Used by vnav-inspect and by tests. Every mutation is counted and revealed
 * directories are recorded, so callers can check what a session did.
 */
class MemoryNodeAdapter : public NodeAdapter {
  public:
    MemoryNodeAdapter(std::string name, std::string path,
                      std::optional<NodeFrameRange> range = std::nullopt);

    std::string name() const override {
        return name_;
    }

    std::string get_path_value() const override {
        return path_;
    }
    void set_path_value(const std::string& path) override;

    std::optional<NodeFrameRange> get_frame_range() const override {
        return range_;
    }
    void set_frame_range(int first, int last) override;

    void reveal_in_file_browser(const std::string& path) override;

    /// Optional hook run by reveal_in_file_browser (vnav-inspect prints the path)
    void set_reveal_handler(std::function<void(const std::string&)> handler) {
        reveal_handler_ = std::move(handler);
    }

    int path_writes() const {
        return path_writes_;
    }
    int range_writes() const {
        return range_writes_;
    }
    const std::vector<std::string>& revealed() const {
        return revealed_;
    }

  private:
    std::string name_;
    std::string path_;
    std::optional<NodeFrameRange> range_;
    std::function<void(const std::string&)> reveal_handler_;
    int path_writes_ = 0;
    int range_writes_ = 0;
    std::vector<std::string> revealed_;
};

} // namespace vnav
