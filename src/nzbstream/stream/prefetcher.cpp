// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/stream/prefetcher.hpp>
#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <algorithm>

namespace nzbstream::stream {

using core::AccessPattern;
using core::StreamErrc;
using core::make_error_code;

namespace {

SegmentFuture ready_future(FetchResult result) {
    std::promise<FetchResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

struct LoadedSegment {
    SegmentData data;
    bool from_source{false};    // Not yet in the persistent cache
};

// Persistent cache, then the article source. Runs on a worker thread.
std::expected<LoadedSegment, std::error_code> load_segment(nntp::ArticleSource& source,
                                                           SegmentCacheService* persistent,
                                                           const std::optional<CacheIdentity>& identity,
                                                           const std::string& message_id,
                                                           const std::string& group,
                                                           std::uint32_t index,
                                                           const std::atomic<bool>& aborted) noexcept {
    if (aborted.load(std::memory_order_acquire)) {
        return std::unexpected(make_error_code(StreamErrc::cancelled));
    }

    if (persistent && identity) {
        if (auto data = persistent->get_cached_segment(identity->mount_id, identity->file_index, index)) {
            spdlog::debug("Persistent cache hit {}/{}/{} ({} bytes)",
                          identity->mount_id, identity->file_index, index, data->size());
            return LoadedSegment{std::move(data), false};
        }
    }

    auto article = source.fetch_decoded(message_id, group);
    if (!article) {
        return std::unexpected(article.error());
    }

    // Share ownership with the decoded article instead of copying
    return LoadedSegment{SegmentData(*article, &(*article)->data), true};
}

} // namespace

//=============================================================================
// AdaptivePrefetcher
//=============================================================================

AdaptivePrefetcher::AdaptivePrefetcher(nntp::ArticleSource& source,
                                       boost::asio::thread_pool& workers,
                                       std::shared_ptr<SegmentStore> store,
                                       core::PrefetchConfig config,
                                       SegmentCacheService* persistent,
                                       std::optional<CacheIdentity> identity,
                                       std::shared_ptr<FetchGate> gate)
    : source_(source)
    , workers_(workers)
    , store_(std::move(store))
    , config_(config)
    , persistent_(persistent)
    , identity_(std::move(identity))
    , gate_(std::move(gate))
    , shared_(std::make_shared<Shared>()) {
    if (config_.pattern_window_size < 2) {
        config_.pattern_window_size = 2;
    }
    const auto& groups = store_->file().groups;
    if (!groups.empty()) {
        group_ = groups.front();
    }
}

AdaptivePrefetcher::~AdaptivePrefetcher() {
    clear();
}

SegmentFuture AdaptivePrefetcher::request_segment(std::uint32_t index) {
    auto lock = std::unique_lock(shared_->mutex);
    record_access(index);

    if (index >= store_->segment_count()) {
        return ready_future(std::unexpected(make_error_code(StreamErrc::segment_not_found)));
    }

    if (auto cached = store_->cached_segment(index)) {
        spdlog::debug("Segment {} served from memory", index);
        schedule_prefetch(index);
        return ready_future(std::move(cached));
    }

    SegmentFuture future;
    if (auto it = shared_->pending.find(index);
        it != shared_->pending.end() && !it->second.aborted->load(std::memory_order_acquire)) {
        // Read-ahead got there first
        future = it->second.future;
    } else {
        future = start_fetch(index, false);
    }

    schedule_prefetch(index);
    return future;
}

void AdaptivePrefetcher::on_seek(std::uint32_t new_index) {
    auto lock = std::unique_lock(shared_->mutex);

    auto from = last_access_;
    auto jump = static_cast<std::int64_t>(new_index) - from;
    if (jump < 0) jump = -jump;
    if (jump > static_cast<std::int64_t>(core::SEEK_JUMP_THRESHOLD)) {
        pattern_ = AccessPattern::random;
    }

    const auto& strat = config_.strategy(pattern_);
    auto relevant_min = static_cast<std::int64_t>(new_index) - core::SEEK_RELEVANT_MARGIN;
    auto relevant_max = static_cast<std::int64_t>(new_index) + strat.window_size + core::SEEK_RELEVANT_MARGIN;

    std::size_t cancelled = 0;
    for (auto it = shared_->pending.begin(); it != shared_->pending.end();) {
        auto idx = static_cast<std::int64_t>(it->first);
        if (idx < relevant_min || idx > relevant_max) {
            it->second.aborted->store(true, std::memory_order_release);
            it = shared_->pending.erase(it);
            ++cancelled;
        } else {
            ++it;
        }
    }

    store_->invalidate_outside_window(new_index, strat.window_size * 2);

    spdlog::debug("Seek {} -> {}: pattern {}, {} prefetches cancelled, {} kept",
                  from, new_index, core::to_string(pattern_), cancelled, shared_->pending.size());

    last_access_ = new_index;
}

void AdaptivePrefetcher::pause() noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    if (!paused_) {
        paused_ = true;
        spdlog::debug("Prefetch paused");
    }
}

void AdaptivePrefetcher::resume() noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    if (paused_) {
        paused_ = false;
        spdlog::debug("Prefetch resumed");
    }
}

bool AdaptivePrefetcher::paused() const noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    return paused_;
}

void AdaptivePrefetcher::clear() noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    for (auto& [index, fetch] : shared_->pending) {
        fetch.aborted->store(true, std::memory_order_release);
    }
    shared_->pending.clear();
    history_.clear();
}

AccessPattern AdaptivePrefetcher::pattern() const noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    return pattern_;
}

core::PrefetchStrategy AdaptivePrefetcher::strategy() const noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    return config_.strategy(pattern_);
}

PrefetchStats AdaptivePrefetcher::stats() const noexcept {
    auto lock = std::unique_lock(shared_->mutex);
    const auto& strat = config_.strategy(pattern_);
    return PrefetchStats{pattern_, strat.window_size, strat.priority, shared_->pending.size(), paused_};
}

std::vector<std::uint32_t> AdaptivePrefetcher::pending_indices() const {
    auto lock = std::unique_lock(shared_->mutex);
    std::vector<std::uint32_t> indices;
    indices.reserve(shared_->pending.size());
    for (const auto& [index, fetch] : shared_->pending) {
        indices.push_back(index);
    }
    return indices;
}

void AdaptivePrefetcher::record_access(std::uint32_t index) {
    history_.push_back(index);
    if (history_.size() > config_.pattern_window_size * 2) {
        history_.erase(history_.begin(),
                       history_.end() - static_cast<std::ptrdiff_t>(config_.pattern_window_size));
    }

    detect_pattern();
    last_access_ = index;
}

void AdaptivePrefetcher::detect_pattern() {
    auto previous = pattern_;

    if (history_.size() < 3) {
        pattern_ = AccessPattern::idle;
    } else {
        auto window = std::min<std::size_t>(history_.size(), config_.pattern_window_size);
        auto first = history_.end() - static_cast<std::ptrdiff_t>(window);

        std::size_t small_steps = 0;
        for (auto it = first + 1; it != history_.end(); ++it) {
            auto delta = static_cast<std::int64_t>(*it) - static_cast<std::int64_t>(*(it - 1));
            if (delta == 0 || delta == 1) {
                ++small_steps;
            }
        }

        double ratio = static_cast<double>(small_steps) / static_cast<double>(window - 1);
        if (ratio >= config_.sequential_threshold) {
            pattern_ = AccessPattern::sequential;
        } else if (ratio < config_.random_threshold) {
            pattern_ = AccessPattern::random;
        } else {
            pattern_ = AccessPattern::idle;
        }
    }

    if (pattern_ != previous) {
        spdlog::debug("Access pattern {} -> {}", core::to_string(previous), core::to_string(pattern_));
    }
}

void AdaptivePrefetcher::schedule_prefetch(std::uint32_t current) {
    if (paused_) return;

    const auto& strat = config_.strategy(pattern_);
    std::uint32_t scheduled = 0;
    for (std::uint32_t i = 1; i <= strat.window_size; ++i) {
        auto next = static_cast<std::uint64_t>(current) + i;
        if (next >= store_->segment_count()) break;

        auto index = static_cast<std::uint32_t>(next);
        if (store_->is_segment_cached(index)) continue;
        if (shared_->pending.contains(index)) continue;

        start_fetch(index, true);
        ++scheduled;
    }

    if (scheduled > 0) {
        spdlog::debug("Scheduled {} prefetches after segment {} ({}, {})", scheduled, current,
                      core::to_string(pattern_), core::to_string(strat.priority));
    }
}

SegmentFuture AdaptivePrefetcher::start_fetch(std::uint32_t index, bool background) {
    const auto* segment = store_->segment(index);
    if (!segment) {
        return ready_future(std::unexpected(make_error_code(StreamErrc::segment_not_found)));
    }

    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto aborted = std::make_shared<std::atomic<bool>>(false);
    auto future = promise->get_future().share();

    auto task = [shared = shared_, store = store_, source = &source_, persistent = persistent_,
                 identity = identity_, message_id = segment->message_id, group = group_,
                 index, background, aborted, promise]() {
        auto loaded = load_segment(*source, persistent, identity, message_id, group, index, *aborted);

        FetchResult result;
        if (loaded) {
            result = loaded->data;
        } else {
            result = std::unexpected(loaded.error());
            if (background && loaded.error() != StreamErrc::cancelled) {
                spdlog::debug("Prefetch of segment {} failed: {}", index, loaded.error().message());
            }
        }

        {
            // clear() and on_seek() abort under this lock, so no write lands after an abort
            auto lock = std::unique_lock(shared->mutex);
            if (loaded && !aborted->load(std::memory_order_acquire)) {
                if (loaded->from_source && persistent && identity) {
                    // The fetch still succeeds when the write-through fails
                    if (auto ec = persistent->cache_segment(identity->mount_id, identity->file_index,
                                                            index, *loaded->data)) {
                        spdlog::debug("Segment {} not persisted: {}", index, ec.message());
                    }
                }
                try {
                    store->cache_segment(index, loaded->data);
                } catch (const std::bad_alloc&) {
                    spdlog::warn("Could not cache segment {}: out of memory", index);
                }
            }

            auto it = shared->pending.find(index);
            if (it != shared->pending.end() && it->second.aborted == aborted) {
                shared->pending.erase(it);
            }
        }

        promise->set_value(std::move(result));
    };

    auto submit = [&] { boost::asio::post(workers_, std::move(task)); };
    if (gate_) {
        if (!gate_->submit_if_open(submit)) {
            spdlog::debug("Fetch of segment {} refused: workers stopping", index);
            return ready_future(std::unexpected(make_error_code(StreamErrc::cancelled)));
        }
    } else {
        submit();
    }

    // Callers hold shared_->mutex, so the task cannot finish before this entry exists
    shared_->pending[index] = PendingFetch{future, aborted};
    return future;
}

} // namespace nzbstream::stream
