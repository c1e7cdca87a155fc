// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "thumbnail_cache.h"

#include <hv/hthreadpool.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace vnav {

// Don't starve the interactive thread
static constexpr int MAX_WORKER_THREADS = 8;

const char* thumbnail_state_name(ThumbnailState state) {
    switch (state) {
    case ThumbnailState::PENDING:
        return "pending";
    case ThumbnailState::READY:
        return "ready";
    case ThumbnailState::FAILED:
        return "failed";
    }
    return "unknown";
}

ThumbnailCache::ThumbnailCache(std::shared_ptr<IThumbnailGenerator> generator, size_t capacity,
                               int worker_threads)
    : generator_(std::move(generator)), capacity_(std::max<size_t>(capacity, 1)),
      worker_threads_(std::clamp(worker_threads, 1, MAX_WORKER_THREADS)),
      thread_pool_(std::make_shared<HThreadPool>(worker_threads_, worker_threads_)) {
    thread_pool_->start(worker_threads_);
    spdlog::debug("[ThumbnailCache] Initialized with {} worker threads, capacity {}",
                  worker_threads_, capacity_);
}

ThumbnailCache::~ThumbnailCache() {
    shutdown();
}

void ThumbnailCache::shutdown() {
    std::shared_ptr<HThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        pool = std::move(thread_pool_);
    }

    // Workers take mutex_ when they finish, so stop outside the lock
    if (pool) {
        pool->wait();
        pool->stop();
    }
}

ThumbnailHandle ThumbnailCache::request(const ThumbnailKey& key, ThumbnailCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(key);
    if (it != records_.end()) {
        Record& record = *it->second;
        record.last_access = ++access_clock_;
        stats_.hits++;
        if (callback) {
            if (record.state == ThumbnailState::PENDING) {
                record.waiters.push_back(std::move(callback));
            } else {
                completions_.push_back({std::move(callback), make_handle(key, record)});
            }
        }
        spdlog::trace("[ThumbnailCache] Hit {}@{} ({})", key.path, key.frame,
                      thumbnail_state_name(record.state));
        return make_handle(key, record);
    }

    stats_.misses++;
    auto record = std::make_shared<Record>();
    record->last_access = ++access_clock_;
    if (callback) {
        record->waiters.push_back(std::move(callback));
    }
    records_.emplace(key, record);

    if (shutdown_ || !thread_pool_) {
        record->state = ThumbnailState::FAILED;
        record->error = "ThumbnailCache is shutdown";
        finish_locked(key, *record);
        return make_handle(key, *record);
    }

    spdlog::debug("[ThumbnailCache] Generating {}@{} ({})", key.path, key.frame,
                  reformat_mode_name(key.mode));
    thread_pool_->commit([this, key]() { run_generation(key); });

    ThumbnailHandle handle = make_handle(key, *record);
    evict_locked();
    return handle;
}

void ThumbnailCache::run_generation(const ThumbnailKey& key) {
    GenerateResult result;
    try {
        result = generator_->generate(key);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    if (result.success && !result.image) {
        result.success = false;
        result.error = "Generator returned no image";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return;
    }
    Record& record = *it->second;
    stats_.generations++;
    if (result.success) {
        record.state = ThumbnailState::READY;
        record.image = std::move(result.image);
        spdlog::debug("[ThumbnailCache] Ready {}@{} ({}x{})", key.path, key.frame,
                      record.image->width, record.image->height);
    } else {
        record.state = ThumbnailState::FAILED;
        record.error = std::move(result.error);
        stats_.failures++;
        spdlog::warn("[ThumbnailCache] Failed {}@{}: {}", key.path, key.frame, record.error);
    }
    finish_locked(key, record);
    evict_locked();
}

void ThumbnailCache::finish_locked(const ThumbnailKey& key, Record& record) {
    const ThumbnailHandle handle = make_handle(key, record);
    for (auto& waiter : record.waiters) {
        completions_.push_back({std::move(waiter), handle});
    }
    record.waiters.clear();
}

void ThumbnailCache::evict_locked() {
    while (records_.size() > capacity_) {
        auto victim = records_.end();
        for (auto it = records_.begin(); it != records_.end(); ++it) {
            if (it->second->state == ThumbnailState::PENDING) {
                continue;
            }
            if (victim == records_.end() ||
                it->second->last_access < victim->second->last_access) {
                victim = it;
            }
        }
        if (victim == records_.end()) {
            // Everything in flight; over capacity until generations finish
            return;
        }
        spdlog::trace("[ThumbnailCache] Evicting {}@{}", victim->first.path, victim->first.frame);
        records_.erase(victim);
        stats_.evictions++;
    }
}

ThumbnailHandle ThumbnailCache::make_handle(const ThumbnailKey& key, const Record& record) {
    ThumbnailHandle handle;
    handle.key = key;
    handle.state = record.state;
    handle.image = record.image;
    handle.error = record.error;
    return handle;
}

std::optional<ThumbnailHandle> ThumbnailCache::peek(const ThumbnailKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return make_handle(key, *it->second);
}

size_t ThumbnailCache::process_completions() {
    std::vector<Completion> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready.swap(completions_);
    }
    for (auto& completion : ready) {
        if (completion.callback) {
            completion.callback(completion.handle);
        }
    }
    return ready.size();
}

void ThumbnailCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second->state != ThumbnailState::PENDING) {
            it = records_.erase(it);
            dropped++;
        } else {
            ++it;
        }
    }
    spdlog::debug("[ThumbnailCache] Cleared {} record(s)", dropped);
}

void ThumbnailCache::wait_for_idle() {
    // The copy keeps the pool alive if shutdown() releases it meanwhile
    std::shared_ptr<HThreadPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = thread_pool_;
    }
    if (pool) {
        pool->wait();
    }
}

size_t ThumbnailCache::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_pool_) {
        return 0;
    }
    return thread_pool_->taskNum();
}

ThumbnailCacheStats ThumbnailCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ThumbnailCacheStats snapshot = stats_;
    snapshot.cached = records_.size();
    return snapshot;
}

} // namespace vnav
