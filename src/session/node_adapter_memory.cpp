// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "node_adapter_memory.h"

#include <spdlog/spdlog.h>

namespace vnav {

MemoryNodeAdapter::MemoryNodeAdapter(std::string name, std::string path,
                                     std::optional<NodeFrameRange> range)
    : name_(std::move(name)), path_(std::move(path)), range_(range) {}

void MemoryNodeAdapter::set_path_value(const std::string& path) {
    spdlog::trace("[MemoryNodeAdapter] {}: path = {}", name_, path);
    path_ = path;
    path_writes_++;
}

void MemoryNodeAdapter::set_frame_range(int first, int last) {
    spdlog::trace("[MemoryNodeAdapter] {}: range = {}-{}", name_, first, last);
    range_ = NodeFrameRange{first, last};
    range_writes_++;
}

void MemoryNodeAdapter::reveal_in_file_browser(const std::string& path) {
    spdlog::debug("[MemoryNodeAdapter] {}: reveal {}", name_, path);
    revealed_.push_back(path);
    if (reveal_handler_) {
        reveal_handler_(path);
    }
}

} // namespace vnav
