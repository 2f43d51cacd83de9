// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/nntp/article_source.hpp>
#include <nzbstream/stream/segment_cache.hpp>
#include <nzbstream/stream/segment_store.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <expected>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace nzbstream::stream {

using FetchResult = std::expected<SegmentData, std::error_code>;
using SegmentFuture = std::shared_future<FetchResult>;

// Key of a file in the persistent cache
struct CacheIdentity {
    std::string mount_id;
    std::uint32_t file_index{0};
};

struct PrefetchStats {
    core::AccessPattern pattern{core::AccessPattern::idle};
    std::uint32_t window_size{0};
    core::PrefetchPriority priority{core::PrefetchPriority::background};
    std::size_t pending{0};
    bool paused{false};
};

// Admission to the worker pool. Closed before the pool is joined; fetches
// started afterwards resolve at once with cancelled.
class FetchGate {
public:
    // Runs submit() unless the gate is closed
    template <typename Submit>
    bool submit_if_open(Submit&& submit) {
        auto lock = std::shared_lock(mutex_);
        if (closed_) return false;
        submit();
        return true;
    }

    // Waits for submissions in progress
    void close() noexcept {
        auto lock = std::unique_lock(mutex_);
        closed_ = true;
    }

    [[nodiscard]] bool closed() const noexcept {
        auto lock = std::shared_lock(mutex_);
        return closed_;
    }

private:
    mutable std::shared_mutex mutex_;
    bool closed_{false};
};

// Fetches segments for one open stream and keeps a window of upcoming
// segments warm. The window follows the detected access pattern.
//
// Lookups go in-memory store, then persistent cache, then the article
// source. Fetches run on the shared worker pool; their results land in the
// store unless the fetch was aborted by a seek or clear().
class AdaptivePrefetcher {
public:
    AdaptivePrefetcher(nntp::ArticleSource& source,
                       boost::asio::thread_pool& workers,
                       std::shared_ptr<SegmentStore> store,
                       core::PrefetchConfig config = {},
                       SegmentCacheService* persistent = nullptr,
                       std::optional<CacheIdentity> identity = std::nullopt,
                       std::shared_ptr<FetchGate> gate = nullptr);
    ~AdaptivePrefetcher();

    AdaptivePrefetcher(const AdaptivePrefetcher&) = delete;
    AdaptivePrefetcher& operator=(const AdaptivePrefetcher&) = delete;

    // Record the access, start (or join) the fetch of index and schedule
    // read-ahead. Errors of this fetch reach the caller through the future.
    [[nodiscard]] SegmentFuture request_segment(std::uint32_t index);

    // Large jumps force the random pattern; fetches outside the new
    // relevant window are aborted and far cache entries dropped
    void on_seek(std::uint32_t new_index);

    // Backpressure: stop scheduling read-ahead
    void pause() noexcept;
    void resume() noexcept;
    [[nodiscard]] bool paused() const noexcept;

    // Abort everything in flight and forget the access history
    void clear() noexcept;

    [[nodiscard]] core::AccessPattern pattern() const noexcept;
    [[nodiscard]] core::PrefetchStrategy strategy() const noexcept;
    [[nodiscard]] PrefetchStats stats() const noexcept;
    [[nodiscard]] std::vector<std::uint32_t> pending_indices() const;

    [[nodiscard]] const std::shared_ptr<SegmentStore>& store() const noexcept { return store_; }

private:
    struct PendingFetch {
        SegmentFuture future;
        std::shared_ptr<std::atomic<bool>> aborted;
    };

    // Outlives the prefetcher while worker tasks still reference it
    struct Shared {
        std::mutex mutex;
        std::map<std::uint32_t, PendingFetch> pending;
    };

    // Callers hold shared_->mutex
    void record_access(std::uint32_t index);
    void detect_pattern();
    void schedule_prefetch(std::uint32_t current);
    SegmentFuture start_fetch(std::uint32_t index, bool background);

    nntp::ArticleSource& source_;
    boost::asio::thread_pool& workers_;
    std::shared_ptr<SegmentStore> store_;
    core::PrefetchConfig config_;
    SegmentCacheService* persistent_;
    std::optional<CacheIdentity> identity_;
    std::shared_ptr<FetchGate> gate_;
    std::string group_;

    std::shared_ptr<Shared> shared_;
    std::deque<std::uint32_t> history_;
    core::AccessPattern pattern_{core::AccessPattern::idle};
    std::int64_t last_access_{-1};
    bool paused_{false};
};

} // namespace nzbstream::stream
