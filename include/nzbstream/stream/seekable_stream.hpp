// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/core/lru_cache.hpp>
#include <nzbstream/nntp/article_source.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <nzbstream/stream/prefetcher.hpp>
#include <nzbstream/stream/segment_cache.hpp>
#include <nzbstream/stream/segment_store.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace nzbstream::stream {

// Inclusive byte range; end -1 means "to the end of the file"
struct ByteRange {
    std::uint64_t start{0};
    std::int64_t end{-1};
};

// Parse an HTTP Range header against a file of total_size bytes.
// Absent or malformed headers yield nullopt (serve the whole file);
// unsatisfiable ranges yield invalid_range. Only the first range of a
// list is honoured.
[[nodiscard]] std::expected<std::optional<ByteRange>, std::error_code>
parse_range_header(std::optional<std::string_view> header, std::uint64_t total_size) noexcept;

enum class ChunkStatus : std::uint8_t {
    data,       // bytes() holds the next slice
    pending,    // Nothing ready yet; poll again later
    end,        // Requested range fully emitted
};

struct StreamChunk {
    ChunkStatus status{ChunkStatus::end};
    SegmentData owner;                      // Keeps the bytes alive
    std::size_t offset{0};
    std::size_t length{0};

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
        if (!owner) return {};
        return std::span<const std::byte>(owner->data() + offset, length);
    }
};

using ChunkResult = std::expected<StreamChunk, std::error_code>;

// Pull interface shared by Usenet-backed and local file streams.
// Not thread safe: one consumer drives a stream.
class ByteStream {
public:
    virtual ~ByteStream() { notify_closed(); }

    // Never blocks; returns pending when the next slice is not ready
    [[nodiscard]] virtual ChunkResult poll_next_chunk() noexcept = 0;

    // Blocks until the next slice or the end
    [[nodiscard]] virtual ChunkResult next_chunk() noexcept = 0;

    // Consumer cannot take more right now; the next pull resumes
    virtual void pause() noexcept = 0;

    // Release everything; further pulls return end
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual std::uint64_t content_length() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t start_byte() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t end_byte() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t total_size() const noexcept = 0;
    [[nodiscard]] virtual bool ended() const noexcept = 0;

    // Runs once when the stream ends, closes or is destroyed
    void on_closed(std::function<void()> hook) { closed_hook_ = std::move(hook); }

protected:
    void notify_closed() noexcept {
        if (auto hook = std::exchange(closed_hook_, nullptr)) hook();
    }

private:
    std::function<void()> closed_hook_;
};

using ProgressCallback = std::function<void(std::uint64_t bytes_streamed, std::uint64_t content_length)>;

struct SeekableStreamOptions {
    nzb::NzbFile file;
    std::optional<ByteRange> range;
    core::PrefetchConfig prefetch;
    std::size_t segment_cache_entries{core::SEGMENT_CACHE_ENTRIES};
    SegmentCacheService* persistent{nullptr};
    std::optional<CacheIdentity> identity;  // Enables persistent cache lookups
    std::shared_ptr<FetchGate> gate;        // Closed when the worker pool stops
    ProgressCallback on_progress;
};

struct StreamStats {
    std::uint64_t bytes_streamed{0};
    std::uint32_t current_segment{0};
    std::uint32_t total_segments{0};
    core::CacheStats cache;
    PrefetchStats prefetch;
};

// Byte stream over one NZB file, fetched segment by segment on demand.
// Chunks are emitted strictly in file order.
class SeekableStream final : public ByteStream {
public:
    [[nodiscard]] static std::expected<std::unique_ptr<SeekableStream>, std::error_code>
    create(nntp::ArticleSource& source, boost::asio::thread_pool& workers, SeekableStreamOptions options);

    ~SeekableStream() override;

    SeekableStream(const SeekableStream&) = delete;
    SeekableStream& operator=(const SeekableStream&) = delete;

    [[nodiscard]] ChunkResult poll_next_chunk() noexcept override;
    [[nodiscard]] ChunkResult next_chunk() noexcept override;
    void pause() noexcept override;
    void close() noexcept override;

    // Continue from offset (within the original range)
    [[nodiscard]] std::error_code seek(std::uint64_t offset) noexcept;

    [[nodiscard]] std::uint64_t content_length() const noexcept override { return end_byte_ + 1 - start_byte_; }
    [[nodiscard]] std::uint64_t start_byte() const noexcept override { return start_byte_; }
    [[nodiscard]] std::uint64_t end_byte() const noexcept override { return end_byte_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept override { return store_->total_size(); }
    [[nodiscard]] bool ended() const noexcept override { return finished_; }

    [[nodiscard]] StreamStats stats() const;
    [[nodiscard]] const nzb::NzbFile& file() const noexcept { return store_->file(); }

private:
    SeekableStream(nntp::ArticleSource& source, boost::asio::thread_pool& workers,
                   std::shared_ptr<SegmentStore> store, SeekableStreamOptions options,
                   std::uint64_t start_byte, std::uint64_t end_byte, SegmentLocation start_location);

    ChunkResult pull(bool blocking) noexcept;
    void advance_segment() noexcept;

    // Clears prefetcher and store cache; safe to call repeatedly
    void finish() noexcept;

    std::shared_ptr<SegmentStore> store_;
    AdaptivePrefetcher prefetcher_;
    ProgressCallback on_progress_;

    std::uint64_t start_byte_{0};
    std::uint64_t end_byte_{0};

    // Stream state
    std::uint32_t current_segment_{0};
    std::uint64_t position_in_segment_{0};
    std::uint64_t next_byte_{0};            // Logical offset of the next emitted byte
    std::uint64_t bytes_streamed_{0};
    bool finished_{false};
    bool paused_{false};

    SegmentData current_data_;
    std::optional<SegmentFuture> in_flight_;
};

// Byte stream over a file on local disk, same range semantics
class LocalFileStream final : public ByteStream {
public:
    [[nodiscard]] static std::expected<std::unique_ptr<LocalFileStream>, std::error_code>
    open(const std::filesystem::path& path, std::optional<ByteRange> range,
         std::size_t chunk_size = core::READ_CHUNK_SIZE) noexcept;

    ~LocalFileStream() override;

    [[nodiscard]] ChunkResult poll_next_chunk() noexcept override { return next_chunk(); }
    [[nodiscard]] ChunkResult next_chunk() noexcept override;
    void pause() noexcept override {}
    void close() noexcept override;

    [[nodiscard]] std::uint64_t content_length() const noexcept override {
        return total_size_ == 0 ? 0 : end_byte_ + 1 - start_byte_;
    }
    [[nodiscard]] std::uint64_t start_byte() const noexcept override { return start_byte_; }
    [[nodiscard]] std::uint64_t end_byte() const noexcept override { return end_byte_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept override { return total_size_; }
    [[nodiscard]] bool ended() const noexcept override { return finished_; }

private:
    LocalFileStream() = default;

    std::ifstream file_;
    std::filesystem::path path_;
    std::size_t chunk_size_{core::READ_CHUNK_SIZE};
    std::uint64_t total_size_{0};
    std::uint64_t start_byte_{0};
    std::uint64_t end_byte_{0};
    std::uint64_t next_byte_{0};
    bool finished_{false};
};

} // namespace nzbstream::stream
