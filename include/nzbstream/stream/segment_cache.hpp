// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <nzbstream/nntp/article_source.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <nzbstream/stream/segment_store.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace nzbstream::stream {

struct SegmentCacheStats {
    std::uint64_t total_segments{0};
    std::uint64_t total_size_bytes{0};
    std::uint64_t mount_count{0};
};

struct CriticalPrefetchResult {
    std::vector<std::uint32_t> segments;    // Indices attempted
    std::uint32_t succeeded{0};             // Includes already cached
    std::uint32_t failed{0};
};

// Decoded segments persisted in SQLite, keyed by (mount, file, segment).
// Survives restarts; used to keep container headers and cues hot.
class SegmentCacheService {
public:
    // Open or create the database; ":memory:" gives a private in-memory cache
    [[nodiscard]] static std::expected<std::unique_ptr<SegmentCacheService>, std::error_code>
    open(const std::string& path) noexcept;

    ~SegmentCacheService();

    SegmentCacheService(const SegmentCacheService&) = delete;
    SegmentCacheService& operator=(const SegmentCacheService&) = delete;

    // Insert or replace
    [[nodiscard]] std::error_code cache_segment(std::string_view mount_id, std::uint32_t file_index,
                                                std::uint32_t segment_index,
                                                std::span<const std::byte> data) noexcept;

    // nullptr on miss; storage errors are logged and read as a miss
    [[nodiscard]] SegmentData get_cached_segment(std::string_view mount_id, std::uint32_t file_index,
                                                 std::uint32_t segment_index) noexcept;

    [[nodiscard]] bool is_segment_cached(std::string_view mount_id, std::uint32_t file_index,
                                         std::uint32_t segment_index) noexcept;

    // Remove every entry of a mount; returns the number removed
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    clear_mount_cache(std::string_view mount_id) noexcept;

    [[nodiscard]] SegmentCacheStats stats() noexcept;

    // Fetch the first segment and the last TAIL_SEGMENTS_COUNT into the cache
    CriticalPrefetchResult prefetch_critical_segments(std::string_view mount_id, std::uint32_t file_index,
                                                      const nzb::NzbFile& file,
                                                      nntp::ArticleSource& source) noexcept;

    // Segment 0 plus the tail, without duplicates
    [[nodiscard]] static std::vector<std::uint32_t> critical_segments(std::uint32_t total_segments);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    SegmentCacheService(std::string path, sqlite3* db) noexcept;

    [[nodiscard]] std::error_code exec(const char* sql) noexcept;

    std::string path_;
    sqlite3* db_{nullptr};
    std::mutex mutex_;
};

} // namespace nzbstream::stream
