// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/core/lru_cache.hpp>
#include <nzbstream/nntp/article_source.hpp>
#include <nzbstream/nntp/manager.hpp>
#include <nzbstream/nzb/media.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <nzbstream/stream/mount.hpp>
#include <nzbstream/stream/segment_cache.hpp>
#include <nzbstream/stream/seekable_stream.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nzbstream::stream {

struct CreateStreamResult {
    std::unique_ptr<ByteStream> stream;
    std::uint64_t content_length{0};
    std::uint64_t start_byte{0};
    std::uint64_t end_byte{0};
    std::uint64_t total_size{0};
    bool is_partial{false};
    std::string content_type;
};

struct StreamabilityResult {
    bool can_stream{false};
    bool requires_extraction{false};
    nzb::ArchiveType archive_type{nzb::ArchiveType::none};
    std::error_code error;
    std::string message;
    std::uint64_t estimated_size{0};
};

struct FileInfo {
    std::string name;
    std::uint64_t size{0};
    std::string content_type;
};

struct ServiceStatus {
    bool ready{false};
    std::size_t providers{0};
    std::vector<nntp::PoolStats> pools;
    core::CacheStats article_cache;
    std::size_t cached_nzbs{0};
    std::size_t tracked_mounts{0};
};

struct SweepResult {
    std::size_t nzbs_expired{0};
    std::size_t mounts_released{0};
    std::size_t connections_closed{0};
};

struct StreamServiceOptions {
    core::PrefetchConfig prefetch;
    std::size_t segment_cache_entries{core::SEGMENT_CACHE_ENTRIES};
    std::chrono::seconds nzb_cache_ttl{core::NZB_CACHE_TTL};
    std::chrono::seconds stream_cleanup_delay{core::STREAM_CLEANUP_DELAY};

    [[nodiscard]] static StreamServiceOptions from(const core::EngineConfig& config) noexcept;
};

// Entry point for playback: resolves (mount, file, Range header) into a
// ready byte stream, rejecting content that cannot be streamed.
class StreamService {
public:
    using Clock = std::chrono::steady_clock;

    // manager is optional; without it status() reports the source as ready
    StreamService(nntp::ArticleSource& source,
                  boost::asio::thread_pool& workers,
                  MountRepository& mounts,
                  SegmentCacheService* persistent,
                  StreamServiceOptions options = {},
                  nntp::NntpManager* manager = nullptr);
    ~StreamService();

    StreamService(const StreamService&) = delete;
    StreamService& operator=(const StreamService&) = delete;

    [[nodiscard]] std::expected<CreateStreamResult, std::error_code>
    create_stream(std::string_view mount_id, std::uint32_t file_index,
                  std::optional<std::string_view> range_header = std::nullopt);

    // Same classification as create_stream, without opening anything
    [[nodiscard]] StreamabilityResult check_streamability(std::string_view mount_id);

    [[nodiscard]] std::expected<FileInfo, std::error_code>
    file_info(std::string_view mount_id, std::uint32_t file_index);

    void cache_nzb(const std::string& hash, nzb::ParsedNzb parsed);

    // Expire stale NZBs, release idle mounts past their cleanup deadline,
    // drop idle provider connections
    SweepResult sweep(Clock::time_point now = Clock::now());

    [[nodiscard]] std::uint32_t active_streams(std::string_view mount_id) const;
    [[nodiscard]] ServiceStatus status() const;

    // Stop accepting streams and drop cached state. Open streams fail with
    // cancelled at their next uncached segment.
    void shutdown() noexcept;

private:
    struct CachedNzb {
        std::shared_ptr<const nzb::ParsedNzb> parsed;
        Clock::time_point cached_at;
    };

    struct MountStreamState {
        std::uint32_t active{0};
        bool has_extracted_file{false};
        std::optional<Clock::time_point> cleanup_at;
    };

    // Shared with close hooks of streams that may outlive the service
    struct StreamRegistry {
        std::mutex mutex;
        std::unordered_map<std::string, MountStreamState> mounts;
        std::chrono::seconds cleanup_delay{core::STREAM_CLEANUP_DELAY};
    };

    [[nodiscard]] std::expected<std::shared_ptr<const nzb::ParsedNzb>, std::error_code>
    parsed_nzb(const MountInfo& mount);

    [[nodiscard]] std::expected<CreateStreamResult, std::error_code>
    create_local_stream(const MountInfo& mount, const std::filesystem::path& path,
                        std::optional<std::string_view> range_header);

    void track_stream(ByteStream& stream, const std::string& mount_id, bool has_extracted_file);
    static void release_stream(const std::weak_ptr<StreamRegistry>& registry, const std::string& mount_id) noexcept;

    nntp::ArticleSource& source_;
    boost::asio::thread_pool& workers_;
    MountRepository& mounts_;
    SegmentCacheService* persistent_;
    nntp::NntpManager* manager_;
    StreamServiceOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CachedNzb> nzb_cache_;
    std::shared_ptr<StreamRegistry> registry_;
    std::shared_ptr<FetchGate> gate_;
    std::atomic<bool> shutdown_{false};
};

} // namespace nzbstream::stream
