// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vnav {

/**
 * @brief Result of listing one directory
 */
struct DirectoryListing {
    bool ok = false;                ///< false if the directory could not be read
    std::vector<std::string> names; ///< Entry names, sorted (empty on failure)
    std::string error;              ///< Reason for failure (empty on success)
};

/**
 * @brief Session-lifetime cache of directory listings
 *
 * Shared by the version resolver and the frame range scanner so rapid
 * navigation does not re-read the same directories. Failed listings are
 * cached too. Entries are only dropped by clear(), which the owning session
 * calls when it ends.
 *
 * Thread-safe: list() may be called from any thread.
 */
class DirectoryListingCache {
  public:
    /**
     * @brief Get the listing of a directory, reading it on first use
     *
     * @param dir Absolute directory path
     * @return Shared immutable listing (never null)
     */
    std::shared_ptr<const DirectoryListing> list(const std::string& dir);

    /// Drop all cached listings
    void clear();

    /// Number of cached directories
    size_t size() const;

    /// Number of actual directory reads performed (cache misses)
    size_t read_count() const {
        return read_count_.load();
    }

  private:
    static std::shared_ptr<const DirectoryListing> read_directory(const std::string& dir);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const DirectoryListing>> listings_;
    std::atomic<size_t> read_count_{0};
};

} // namespace vnav
