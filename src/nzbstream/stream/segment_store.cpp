// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/stream/segment_store.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace nzbstream::stream {

using core::StreamErrc;
using core::make_error_code;

SegmentStore::SegmentStore(nzb::NzbFile file, std::size_t cache_entries)
    : file_(std::move(file))
    , cache_(cache_entries) {
    offsets_.reserve(file_.segments.size() + 1);
    std::uint64_t offset = 0;
    for (const auto& seg : file_.segments) {
        offsets_.push_back(offset);
        offset += seg.bytes;
    }
    offsets_.push_back(offset);
}

std::expected<SegmentLocation, std::error_code>
SegmentStore::find_segment_for_offset(std::uint64_t offset) const noexcept {
    if (offset >= total_size()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    // First start strictly greater than offset, minus one
    auto it = std::upper_bound(offsets_.begin(), offsets_.end(), offset);
    auto index = static_cast<std::uint32_t>(std::distance(offsets_.begin(), it) - 1);
    return SegmentLocation{index, offset - offsets_[index]};
}

const nzb::NzbSegment* SegmentStore::segment(std::uint32_t index) const noexcept {
    if (index >= file_.segments.size()) return nullptr;
    return &file_.segments[index];
}

std::uint64_t SegmentStore::segment_offset(std::uint32_t index) const noexcept {
    if (index >= offsets_.size()) return total_size();
    return offsets_[index];
}

void SegmentStore::cache_segment(std::uint32_t index, SegmentData data) {
    if (!data || index >= segment_count()) return;
    auto lock = std::unique_lock(mutex_);
    cache_.put(index, std::move(data));
}

SegmentData SegmentStore::cached_segment(std::uint32_t index) {
    auto lock = std::unique_lock(mutex_);
    auto hit = cache_.get(index);
    return hit ? *hit : nullptr;
}

bool SegmentStore::is_segment_cached(std::uint32_t index) const {
    auto lock = std::unique_lock(mutex_);
    return cache_.contains(index);
}

std::size_t SegmentStore::invalidate_outside_window(std::uint32_t center, std::uint32_t radius) {
    auto lo = center > radius ? center - radius : 0u;
    auto hi = static_cast<std::uint64_t>(center) + radius;

    auto lock = std::unique_lock(mutex_);
    auto removed = cache_.erase_if([lo, hi](std::uint32_t index) {
        return index < lo || index > hi;
    });
    if (removed > 0) {
        spdlog::debug("Evicted {} cached segments outside [{}, {}]", removed, lo, hi);
    }
    return removed;
}

void SegmentStore::clear_cache() noexcept {
    auto lock = std::unique_lock(mutex_);
    cache_.clear();
}

core::CacheStats SegmentStore::cache_stats() const {
    auto lock = std::unique_lock(mutex_);
    return cache_.stats();
}

} // namespace nzbstream::stream
