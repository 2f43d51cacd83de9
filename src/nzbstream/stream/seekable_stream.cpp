// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/stream/seekable_stream.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <utility>

namespace nzbstream::stream {

using core::StreamErrc;
using core::make_error_code;

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<std::uint64_t> parse_number(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

bool starts_with_icase(std::string_view s, std::string_view prefix) noexcept {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

// Inclusive [start, end] of a (possibly open) range within total bytes
std::expected<std::pair<std::uint64_t, std::uint64_t>, std::error_code>
resolve_range(const std::optional<ByteRange>& range, std::uint64_t total) noexcept {
    if (total == 0) {
        if (range) return std::unexpected(make_error_code(StreamErrc::invalid_range));
        return std::pair<std::uint64_t, std::uint64_t>{0, 0};
    }

    std::uint64_t start = 0;
    std::uint64_t end = total - 1;
    if (range) {
        start = range->start;
        if (range->end >= 0) {
            end = std::min(static_cast<std::uint64_t>(range->end), total - 1);
        }
        if (start > end) {
            return std::unexpected(make_error_code(StreamErrc::invalid_range));
        }
    }
    return std::pair{start, end};
}

} // namespace

std::expected<std::optional<ByteRange>, std::error_code>
parse_range_header(std::optional<std::string_view> header, std::uint64_t total_size) noexcept {
    if (!header) return std::nullopt;

    auto value = trim(*header);
    if (!starts_with_icase(value, "bytes=")) {
        return std::nullopt;
    }
    value.remove_prefix(6);

    // Multiple ranges: serve the first
    if (auto comma = value.find(','); comma != std::string_view::npos) {
        value = value.substr(0, comma);
    }
    value = trim(value);

    auto dash = value.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto first = trim(value.substr(0, dash));
    auto second = trim(value.substr(dash + 1));

    if (first.empty()) {
        // Suffix range: last n bytes
        auto suffix = parse_number(second);
        if (!suffix) return std::nullopt;
        if (*suffix == 0 || total_size == 0) {
            return std::unexpected(make_error_code(StreamErrc::invalid_range));
        }
        auto start = *suffix >= total_size ? 0 : total_size - *suffix;
        return ByteRange{start, static_cast<std::int64_t>(total_size - 1)};
    }

    auto start = parse_number(first);
    if (!start) return std::nullopt;
    if (*start >= total_size) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }

    if (second.empty()) {
        return ByteRange{*start, -1};
    }

    auto end = parse_number(second);
    if (!end) return std::nullopt;
    if (*start > *end) {
        return std::unexpected(make_error_code(StreamErrc::invalid_range));
    }
    return ByteRange{*start, static_cast<std::int64_t>(std::min(*end, total_size - 1))};
}

//=============================================================================
// SeekableStream
//=============================================================================

std::expected<std::unique_ptr<SeekableStream>, std::error_code>
SeekableStream::create(nntp::ArticleSource& source, boost::asio::thread_pool& workers,
                       SeekableStreamOptions options) {
    auto store = std::make_shared<SegmentStore>(std::move(options.file), options.segment_cache_entries);
    if (store->segment_count() == 0 || store->total_size() == 0) {
        return std::unexpected(make_error_code(StreamErrc::segment_not_found));
    }

    auto bounds = resolve_range(options.range, store->total_size());
    if (!bounds) {
        spdlog::debug("Range {}-{} not satisfiable for {} ({} bytes)", options.range->start,
                      options.range->end, store->file().name, store->total_size());
        return std::unexpected(bounds.error());
    }

    auto location = store->find_segment_for_offset(bounds->first);
    if (!location) {
        return std::unexpected(location.error());
    }

    return std::unique_ptr<SeekableStream>(new SeekableStream(
        source, workers, std::move(store), std::move(options), bounds->first, bounds->second, *location));
}

SeekableStream::SeekableStream(nntp::ArticleSource& source, boost::asio::thread_pool& workers,
                               std::shared_ptr<SegmentStore> store, SeekableStreamOptions options,
                               std::uint64_t start_byte, std::uint64_t end_byte,
                               SegmentLocation start_location)
    : store_(std::move(store))
    , prefetcher_(source, workers, store_, options.prefetch, options.persistent, std::move(options.identity),
                  std::move(options.gate))
    , on_progress_(std::move(options.on_progress))
    , start_byte_(start_byte)
    , end_byte_(end_byte)
    , current_segment_(start_location.segment_index)
    , position_in_segment_(start_location.offset_in_segment)
    , next_byte_(start_byte) {
    if (options.range) {
        // Starting mid-file looks like a seek to the prefetcher
        prefetcher_.on_seek(start_location.segment_index);
    }

    spdlog::debug("Stream opened for {}: bytes {}-{}/{} from segment {} of {}", store_->file().name,
                  start_byte_, end_byte_, store_->total_size(), current_segment_, store_->segment_count());
}

SeekableStream::~SeekableStream() {
    finish();
}

ChunkResult SeekableStream::poll_next_chunk() noexcept {
    return pull(false);
}

ChunkResult SeekableStream::next_chunk() noexcept {
    return pull(true);
}

ChunkResult SeekableStream::pull(bool blocking) noexcept {
    if (finished_) {
        return StreamChunk{ChunkStatus::end};
    }

    if (paused_) {
        // Asked again: the consumer has room
        paused_ = false;
        prefetcher_.resume();
    }

    while (true) {
        if (next_byte_ > end_byte_) {
            finish();
            return StreamChunk{ChunkStatus::end};
        }

        if (!current_data_) {
            if (current_segment_ >= store_->segment_count()) {
                finish();
                return StreamChunk{ChunkStatus::end};
            }

            if (!in_flight_) {
                try {
                    in_flight_ = prefetcher_.request_segment(current_segment_);
                } catch (const std::exception& e) {
                    spdlog::error("Stream of {} failed to request segment {}: {}",
                                  store_->file().name, current_segment_, e.what());
                    finish();
                    return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
                }
            }

            if (!blocking && in_flight_->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return StreamChunk{ChunkStatus::pending};
            }

            auto result = in_flight_->get();
            in_flight_.reset();
            if (!result) {
                spdlog::error("Stream of {} failed at segment {}: {}", store_->file().name,
                              current_segment_, result.error().message());
                finish();
                return std::unexpected(result.error());
            }
            current_data_ = std::move(*result);
        }

        auto size = static_cast<std::uint64_t>(current_data_->size());
        auto segment_remaining = position_in_segment_ < size ? size - position_in_segment_ : 0;
        auto requested_remaining = end_byte_ - next_byte_ + 1;
        auto to_read = std::min(segment_remaining, requested_remaining);

        if (to_read == 0) {
            advance_segment();
            continue;
        }

        StreamChunk chunk{ChunkStatus::data, current_data_,
                          static_cast<std::size_t>(position_in_segment_), static_cast<std::size_t>(to_read)};

        position_in_segment_ += to_read;
        next_byte_ += to_read;
        bytes_streamed_ += to_read;

        if (on_progress_) {
            on_progress_(bytes_streamed_, content_length());
        }

        if (position_in_segment_ >= size) {
            advance_segment();
        }
        return chunk;
    }
}

void SeekableStream::advance_segment() noexcept {
    ++current_segment_;
    position_in_segment_ = 0;
    current_data_.reset();
}

void SeekableStream::pause() noexcept {
    if (finished_ || paused_) return;
    paused_ = true;
    prefetcher_.pause();
}

void SeekableStream::close() noexcept {
    finish();
}

std::error_code SeekableStream::seek(std::uint64_t offset) noexcept {
    if (finished_) {
        return make_error_code(StreamErrc::cancelled);
    }
    if (offset < start_byte_ || offset > end_byte_) {
        return make_error_code(StreamErrc::invalid_range);
    }

    auto location = store_->find_segment_for_offset(offset);
    if (!location) {
        return location.error();
    }

    prefetcher_.on_seek(location->segment_index);

    current_segment_ = location->segment_index;
    position_in_segment_ = location->offset_in_segment;
    next_byte_ = offset;
    current_data_.reset();
    in_flight_.reset();
    return {};
}

void SeekableStream::finish() noexcept {
    if (finished_) return;
    finished_ = true;

    prefetcher_.clear();
    store_->clear_cache();
    current_data_.reset();
    in_flight_.reset();

    spdlog::debug("Stream for {} closed after {} of {} bytes", store_->file().name,
                  bytes_streamed_, content_length());
    notify_closed();
}

StreamStats SeekableStream::stats() const {
    return StreamStats{
        bytes_streamed_,
        current_segment_,
        store_->segment_count(),
        store_->cache_stats(),
        prefetcher_.stats(),
    };
}

//=============================================================================
// LocalFileStream
//=============================================================================

std::expected<std::unique_ptr<LocalFileStream>, std::error_code>
LocalFileStream::open(const std::filesystem::path& path, std::optional<ByteRange> range,
                      std::size_t chunk_size) noexcept {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        spdlog::debug("Local file {} unavailable: {}", path.string(), ec.message());
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }

    auto bounds = resolve_range(range, size);
    if (!bounds) {
        return std::unexpected(bounds.error());
    }

    std::unique_ptr<LocalFileStream> stream;
    try {
        stream.reset(new LocalFileStream());
        stream->path_ = path;
        stream->file_.open(path, std::ios::binary);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
    if (!stream->file_) {
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }

    stream->chunk_size_ = chunk_size > 0 ? chunk_size : core::READ_CHUNK_SIZE;
    stream->total_size_ = size;
    stream->start_byte_ = bounds->first;
    stream->end_byte_ = bounds->second;
    stream->next_byte_ = bounds->first;
    stream->finished_ = size == 0;

    stream->file_.seekg(static_cast<std::streamoff>(bounds->first));
    if (!stream->file_) {
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }
    return stream;
}

ChunkResult LocalFileStream::next_chunk() noexcept {
    if (finished_) {
        return StreamChunk{ChunkStatus::end};
    }
    if (next_byte_ > end_byte_) {
        close();
        return StreamChunk{ChunkStatus::end};
    }

    auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, end_byte_ - next_byte_ + 1));
    try {
        auto buffer = std::make_shared<std::vector<std::byte>>(want);
        file_.read(reinterpret_cast<char*>(buffer->data()), static_cast<std::streamsize>(want));
        auto got = file_.gcount();
        if (got <= 0) {
            spdlog::error("Read of {} failed at offset {}", path_.string(), next_byte_);
            close();
            return std::unexpected(make_error_code(StreamErrc::io_error));
        }

        buffer->resize(static_cast<std::size_t>(got));
        next_byte_ += static_cast<std::uint64_t>(got);
        return StreamChunk{ChunkStatus::data, std::move(buffer), 0, static_cast<std::size_t>(got)};
    } catch (const std::bad_alloc&) {
        close();
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
}

void LocalFileStream::close() noexcept {
    finished_ = true;
    if (file_.is_open()) file_.close();
    notify_closed();
}

LocalFileStream::~LocalFileStream() {
    close();
}

} // namespace nzbstream::stream
