// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "thumbnail_generator.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations
class HThreadPool;

/**
 * @file thumbnail_cache.h
 * @brief Non-blocking in-memory cache of preview images
 *
 * request() never blocks: it returns the current state of the key and, on a
 * miss, commits one generation to a fixed-size worker pool. Requests for a key
 * that is already being generated attach to that generation instead of
 * starting another.
 *
 * Completion callbacks are not invoked on workers. They are queued and run by
 * process_completions(), which the interactive thread calls from its loop.
 *
 * ## Usage Example
 * ```cpp
 * auto generator = std::make_shared<StbThumbnailGenerator>(ThumbnailCanvas{});
 * ThumbnailCache cache(generator, 64, 2);
 *
 * ThumbnailKey key{"/shots/010/shot_v003.%04d.exr", 1005, ReformatMode::FILL};
 * auto handle = cache.request(key, [this, key](const ThumbnailHandle& done) {
 *     if (done.key != current_key_) {
 *         return; // stale
 *     }
 *     show(done);
 * });
 *
 * // ...in the event loop
 * cache.process_completions();
 * ```
 */

namespace vnav {

enum class ThumbnailState { PENDING, READY, FAILED };

const char* thumbnail_state_name(ThumbnailState state);

/**
 * @brief Read-only snapshot of a cache record
 */
struct ThumbnailHandle {
    ThumbnailKey key;
    ThumbnailState state = ThumbnailState::PENDING;
    std::shared_ptr<const ThumbnailImage> image; ///< Set when READY
    std::string error;                           ///< Set when FAILED

    bool ready() const {
        return state == ThumbnailState::READY;
    }
    bool pending() const {
        return state == ThumbnailState::PENDING;
    }
    bool failed() const {
        return state == ThumbnailState::FAILED;
    }
};

using ThumbnailCallback = std::function<void(const ThumbnailHandle& handle)>;

struct ThumbnailCacheStats {
    size_t hits = 0;        ///< Requests answered by an existing record
    size_t misses = 0;      ///< Requests that created a record
    size_t generations = 0; ///< Completed generations (success or failure)
    size_t failures = 0;    ///< Generations that failed
    size_t evictions = 0;
    size_t cached = 0; ///< Records currently held
};

class ThumbnailCache {
  public:
    /**
     * @param generator Decode step run on the workers (shared, must be thread-safe)
     * @param capacity Maximum number of records kept (PENDING records are never evicted)
     * @param worker_threads Fixed size of the worker pool
     */
    ThumbnailCache(std::shared_ptr<IThumbnailGenerator> generator, size_t capacity,
                   int worker_threads);
    ~ThumbnailCache();

    ThumbnailCache(const ThumbnailCache&) = delete;
    ThumbnailCache& operator=(const ThumbnailCache&) = delete;

    /**
     * @brief Get or start the preview of a key
     *
     * @param key Path, frame and reformat mode
     * @param callback Queued once the record is READY or FAILED (may be null)
     * @return Snapshot of the record state at call time
     */
    ThumbnailHandle request(const ThumbnailKey& key, ThumbnailCallback callback = nullptr);

    /**
     * @brief Look up a key without starting generation or touching LRU order
     */
    std::optional<ThumbnailHandle> peek(const ThumbnailKey& key) const;

    /**
     * @brief Run queued completion callbacks on the calling thread
     *
     * @return Number of callbacks run
     */
    size_t process_completions();

    /// Drop every READY/FAILED record
    void clear();

    /// Block until the worker pool is idle; safe against a concurrent shutdown()
    void wait_for_idle();

    size_t pending_tasks() const;

    ThumbnailCacheStats stats() const;

    size_t capacity() const {
        return capacity_;
    }

    /// Stop the worker pool; later misses fail immediately
    void shutdown();

  private:
    struct Record {
        ThumbnailState state = ThumbnailState::PENDING;
        std::shared_ptr<const ThumbnailImage> image;
        std::string error;
        uint64_t last_access = 0;
        std::vector<ThumbnailCallback> waiters;
    };

    struct Completion {
        ThumbnailCallback callback;
        ThumbnailHandle handle;
    };

    void run_generation(const ThumbnailKey& key);
    void finish_locked(const ThumbnailKey& key, Record& record);
    void evict_locked();
    static ThumbnailHandle make_handle(const ThumbnailKey& key, const Record& record);

    std::shared_ptr<IThumbnailGenerator> generator_;
    size_t capacity_;
    int worker_threads_;
    std::shared_ptr<HThreadPool> thread_pool_; ///< Shared with wait_for_idle() callers

    mutable std::mutex mutex_;
    std::unordered_map<ThumbnailKey, std::shared_ptr<Record>, ThumbnailKeyHash> records_;
    std::vector<Completion> completions_;
    ThumbnailCacheStats stats_;
    uint64_t access_clock_ = 0;
    bool shutdown_ = false;
};

} // namespace vnav
