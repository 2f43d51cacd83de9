// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/core/lru_cache.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <vector>

namespace nzbstream::stream {

// Decoded bytes of one segment, shared between cache and readers
using SegmentData = std::shared_ptr<const std::vector<std::byte>>;

struct SegmentLocation {
    std::uint32_t segment_index{0};
    std::uint64_t offset_in_segment{0};
};

// Byte-offset index over one file's segments plus a bounded cache of
// decoded segments. Safe for concurrent use by a stream and its fetches.
class SegmentStore {
public:
    explicit SegmentStore(nzb::NzbFile file, std::size_t cache_entries = core::SEGMENT_CACHE_ENTRIES);

    // Segment containing offset; invalid_range for offset >= total_size()
    [[nodiscard]] std::expected<SegmentLocation, std::error_code>
    find_segment_for_offset(std::uint64_t offset) const noexcept;

    // nullptr when out of range
    [[nodiscard]] const nzb::NzbSegment* segment(std::uint32_t index) const noexcept;

    // Start offset of a segment in the file
    [[nodiscard]] std::uint64_t segment_offset(std::uint32_t index) const noexcept;

    [[nodiscard]] std::uint32_t segment_count() const noexcept {
        return static_cast<std::uint32_t>(file_.segments.size());
    }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return offsets_.back(); }
    [[nodiscard]] const nzb::NzbFile& file() const noexcept { return file_; }

    // Insert or overwrite
    void cache_segment(std::uint32_t index, SegmentData data);

    // nullptr on miss
    [[nodiscard]] SegmentData cached_segment(std::uint32_t index);

    [[nodiscard]] bool is_segment_cached(std::uint32_t index) const;

    // Drop cached segments farther than radius from center; returns how many
    std::size_t invalidate_outside_window(std::uint32_t center, std::uint32_t radius);

    void clear_cache() noexcept;

    [[nodiscard]] core::CacheStats cache_stats() const;

private:
    nzb::NzbFile file_;
    std::vector<std::uint64_t> offsets_;    // offsets_[i] = start of segment i, back() = total

    mutable std::mutex mutex_;
    core::LruCache<std::uint32_t, SegmentData> cache_;
};

} // namespace nzbstream::stream
