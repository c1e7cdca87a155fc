// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "directory_listing_cache.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace vnav {

std::shared_ptr<const DirectoryListing> DirectoryListingCache::list(const std::string& dir) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listings_.find(dir);
        if (it != listings_.end()) {
            return it->second;
        }
    }

    // Read outside the lock; a concurrent first read of the same directory
    // is harmless, the first stored result wins.
    auto listing = read_directory(dir);
    read_count_++;

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = listings_.emplace(dir, std::move(listing));
    return inserted.first->second;
}

void DirectoryListingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("[DirectoryListingCache] Clearing {} listing(s)", listings_.size());
    listings_.clear();
}

size_t DirectoryListingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listings_.size();
}

std::shared_ptr<const DirectoryListing>
DirectoryListingCache::read_directory(const std::string& dir) {
    auto listing = std::make_shared<DirectoryListing>();

    std::error_code ec;
    fs::directory_iterator it(dir.empty() ? "." : dir, ec);
    if (ec) {
        listing->error = ec.message();
        spdlog::debug("[DirectoryListingCache] Cannot list {}: {}", dir, listing->error);
        return listing;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        listing->names.push_back(it->path().filename().string());
    }
    if (ec) {
        listing->names.clear();
        listing->error = ec.message();
        spdlog::debug("[DirectoryListingCache] Listing {} failed midway: {}", dir, listing->error);
        return listing;
    }

    std::sort(listing->names.begin(), listing->names.end());
    listing->ok = true;
    spdlog::trace("[DirectoryListingCache] Listed {} ({} entries)", dir, listing->names.size());
    return listing;
}

} // namespace vnav
