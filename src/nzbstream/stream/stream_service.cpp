// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/stream/stream_service.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace nzbstream::stream {

using core::StreamErrc;
using core::make_error_code;

namespace {

std::string describe_range(const std::optional<ByteRange>& range) {
    if (!range) return "full";
    if (range->end < 0) return std::to_string(range->start) + "-";
    return std::to_string(range->start) + "-" + std::to_string(range->end);
}

StreamabilityResult not_streamable(std::error_code error, nzb::ArchiveType archive, std::string message) {
    StreamabilityResult result;
    result.can_stream = false;
    result.archive_type = archive;
    result.error = error;
    result.message = std::move(message);
    return result;
}

} // namespace

StreamServiceOptions StreamServiceOptions::from(const core::EngineConfig& config) noexcept {
    StreamServiceOptions options;
    options.prefetch = config.prefetch;
    options.segment_cache_entries = config.segment_cache_entries;
    options.nzb_cache_ttl = config.nzb_cache_ttl;
    options.stream_cleanup_delay = config.stream_cleanup_delay;
    return options;
}

//=============================================================================
// StreamService
//=============================================================================

StreamService::StreamService(nntp::ArticleSource& source,
                             boost::asio::thread_pool& workers,
                             MountRepository& mounts,
                             SegmentCacheService* persistent,
                             StreamServiceOptions options,
                             nntp::NntpManager* manager)
    : source_(source)
    , workers_(workers)
    , mounts_(mounts)
    , persistent_(persistent)
    , manager_(manager)
    , options_(options)
    , registry_(std::make_shared<StreamRegistry>())
    , gate_(std::make_shared<FetchGate>()) {
    registry_->cleanup_delay = options_.stream_cleanup_delay;
}

StreamService::~StreamService() {
    shutdown();
}

std::expected<CreateStreamResult, std::error_code>
StreamService::create_stream(std::string_view mount_id, std::uint32_t file_index,
                             std::optional<std::string_view> range_header) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return std::unexpected(make_error_code(StreamErrc::cancelled));
    }

    auto mount = mounts_.get_mount(mount_id);
    if (!mount) {
        spdlog::debug("Mount {} not found", mount_id);
        return std::unexpected(make_error_code(StreamErrc::mount_not_found));
    }

    if (mount->extracted_file_path) {
        std::error_code ec;
        if (std::filesystem::exists(*mount->extracted_file_path, ec)) {
            return create_local_stream(*mount, *mount->extracted_file_path, range_header);
        }
    }

    if (mount->status == MountStatus::downloading) {
        return std::unexpected(make_error_code(StreamErrc::mount_downloading));
    }

    auto parsed = parsed_nzb(*mount);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    if (nzb::is_rar_only(**parsed)) {
        spdlog::info("Mount {} is RAR-only, refusing to stream", mount_id);
        return std::unexpected(make_error_code(StreamErrc::rar_only));
    }

    if (mount->status != MountStatus::ready) {
        spdlog::debug("Mount {} not ready ({})", mount_id, to_string(mount->status));
        return std::unexpected(make_error_code(StreamErrc::mount_not_ready));
    }

    const auto* file = nzb::find_file(**parsed, file_index);
    if (!file) {
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }

    mounts_.touch_mount(mount_id);

    auto range = parse_range_header(range_header, file->size);
    if (!range) {
        spdlog::debug("Unsatisfiable range '{}' for {} ({} bytes)", range_header.value_or(""), file->name, file->size);
        return std::unexpected(range.error());
    }

    SeekableStreamOptions stream_options;
    stream_options.file = *file;
    stream_options.range = *range;
    stream_options.prefetch = options_.prefetch;
    stream_options.segment_cache_entries = options_.segment_cache_entries;
    stream_options.persistent = persistent_;
    stream_options.identity = CacheIdentity{std::string(mount_id), file_index};
    stream_options.gate = gate_;

    auto stream = SeekableStream::create(source_, workers_, std::move(stream_options));
    if (!stream) {
        return std::unexpected(stream.error());
    }

    CreateStreamResult result;
    result.content_length = (*stream)->content_length();
    result.start_byte = (*stream)->start_byte();
    result.end_byte = (*stream)->end_byte();
    result.total_size = (*stream)->total_size();
    result.is_partial = range->has_value();
    result.content_type = std::string(nzb::content_type(file->name));

    track_stream(**stream, std::string(mount_id), false);
    result.stream = std::move(*stream);

    spdlog::info("Stream created for mount {} file {} ({}), range {}, {}", mount_id, file_index, file->name,
                 describe_range(*range), result.content_type);
    return result;
}

std::expected<CreateStreamResult, std::error_code>
StreamService::create_local_stream(const MountInfo& mount, const std::filesystem::path& path,
                                   std::optional<std::string_view> range_header) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }

    auto range = parse_range_header(range_header, size);
    if (!range) {
        return std::unexpected(range.error());
    }

    auto stream = LocalFileStream::open(path, *range);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    CreateStreamResult result;
    result.content_length = (*stream)->content_length();
    result.start_byte = (*stream)->start_byte();
    result.end_byte = (*stream)->end_byte();
    result.total_size = size;
    result.is_partial = range->has_value();
    result.content_type = std::string(nzb::content_type(path.filename().string()));

    track_stream(**stream, mount.id, true);
    result.stream = std::move(*stream);

    spdlog::info("Streaming mount {} from extracted file {}, range {}", mount.id,
                 path.filename().string(), describe_range(*range));
    return result;
}

StreamabilityResult StreamService::check_streamability(std::string_view mount_id) {
    auto mount = mounts_.get_mount(mount_id);
    if (!mount) {
        return not_streamable(make_error_code(StreamErrc::mount_not_found), nzb::ArchiveType::none, "Mount not found");
    }

    auto parsed = parsed_nzb(*mount);
    if (!parsed) {
        return not_streamable(parsed.error(), nzb::ArchiveType::none, parsed.error().message());
    }

    const auto& release = **parsed;
    if (nzb::is_rar_only(release)) {
        spdlog::info("Mount {} holds RAR archives only", mount_id);
        return not_streamable(make_error_code(StreamErrc::rar_only), nzb::ArchiveType::rar,
                              "RAR-compressed releases cannot be streamed. Use a download client instead.");
    }

    const auto* best = nzb::best_streamable_file(release);
    if (!best) {
        // Name the archive format when that is what blocks playback
        for (const auto& file : release.files) {
            auto archive = nzb::archive_type(file.name);
            if (archive != nzb::ArchiveType::none) {
                return not_streamable(make_error_code(StreamErrc::not_streamable), archive,
                                      std::string("This release is ") + std::string(nzb::to_string(archive)) +
                                      " compressed and cannot be streamed.");
            }
        }
        return not_streamable(make_error_code(StreamErrc::no_media_files), nzb::ArchiveType::none,
                              "No streamable media files found in this release.");
    }

    StreamabilityResult result;
    result.can_stream = true;
    result.estimated_size = best->size;
    return result;
}

std::expected<FileInfo, std::error_code>
StreamService::file_info(std::string_view mount_id, std::uint32_t file_index) {
    auto mount = mounts_.get_mount(mount_id);
    if (!mount) {
        return std::unexpected(make_error_code(StreamErrc::mount_not_found));
    }

    auto parsed = parsed_nzb(*mount);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (nzb::is_rar_only(**parsed)) {
        return std::unexpected(make_error_code(StreamErrc::rar_only));
    }

    const auto* file = nzb::find_file(**parsed, file_index);
    if (!file) {
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }
    return FileInfo{file->name, file->size, std::string(nzb::content_type(file->name))};
}

std::expected<std::shared_ptr<const nzb::ParsedNzb>, std::error_code>
StreamService::parsed_nzb(const MountInfo& mount) {
    auto now = Clock::now();
    auto lock = std::unique_lock(mutex_);

    if (auto it = nzb_cache_.find(mount.nzb_hash); it != nzb_cache_.end()) {
        if (now - it->second.cached_at < options_.nzb_cache_ttl) {
            return it->second.parsed;
        }
        nzb_cache_.erase(it);
    }

    // Rebuild from the segment lists stored with the mount
    if (mount.media_files.empty() || mount.media_files.front().segments.empty()) {
        spdlog::warn("Mount {} has no stored segments; it needs to be recreated", mount.id);
        return std::unexpected(make_error_code(StreamErrc::nzb_unavailable));
    }

    auto rebuilt = nzb::make_parsed_nzb(mount.media_files);
    rebuilt.hash = mount.nzb_hash;
    auto parsed = std::make_shared<const nzb::ParsedNzb>(std::move(rebuilt));
    nzb_cache_[mount.nzb_hash] = CachedNzb{parsed, now};
    return parsed;
}

void StreamService::cache_nzb(const std::string& hash, nzb::ParsedNzb parsed) {
    auto entry = CachedNzb{std::make_shared<const nzb::ParsedNzb>(std::move(parsed)), Clock::now()};
    auto lock = std::unique_lock(mutex_);
    nzb_cache_[hash] = std::move(entry);
}

void StreamService::track_stream(ByteStream& stream, const std::string& mount_id, bool has_extracted_file) {
    {
        auto lock = std::unique_lock(registry_->mutex);
        auto& state = registry_->mounts[mount_id];
        state.cleanup_at.reset();
        ++state.active;
        state.has_extracted_file = has_extracted_file;
    }

    std::weak_ptr<StreamRegistry> registry = registry_;
    stream.on_closed([registry, mount_id] { release_stream(registry, mount_id); });
}

void StreamService::release_stream(const std::weak_ptr<StreamRegistry>& weak, const std::string& mount_id) noexcept {
    auto registry = weak.lock();
    if (!registry) return;

    auto lock = std::unique_lock(registry->mutex);
    auto it = registry->mounts.find(mount_id);
    if (it == registry->mounts.end()) return;

    auto& state = it->second;
    if (state.active > 0) --state.active;
    if (state.active > 0) return;

    if (state.has_extracted_file) {
        state.cleanup_at = Clock::now() + registry->cleanup_delay;
        spdlog::debug("Mount {} has no active streams; cleanup in {}s", mount_id, registry->cleanup_delay.count());
    } else {
        registry->mounts.erase(it);
    }
}

SweepResult StreamService::sweep(Clock::time_point now) {
    SweepResult result;

    {
        auto lock = std::unique_lock(mutex_);
        result.nzbs_expired = std::erase_if(nzb_cache_, [&](const auto& entry) {
            return now - entry.second.cached_at >= options_.nzb_cache_ttl;
        });
    }

    {
        auto lock = std::unique_lock(registry_->mutex);
        result.mounts_released = std::erase_if(registry_->mounts, [&](const auto& entry) {
            const auto& state = entry.second;
            return state.active == 0 && state.cleanup_at && *state.cleanup_at <= now;
        });
    }

    if (manager_) {
        result.connections_closed = manager_->idle_disconnect();
    }

    if (result.nzbs_expired > 0 || result.mounts_released > 0 || result.connections_closed > 0) {
        spdlog::debug("Sweep: {} NZBs expired, {} mounts released, {} connections closed",
                      result.nzbs_expired, result.mounts_released, result.connections_closed);
    }
    return result;
}

std::uint32_t StreamService::active_streams(std::string_view mount_id) const {
    auto lock = std::unique_lock(registry_->mutex);
    auto it = registry_->mounts.find(std::string(mount_id));
    return it != registry_->mounts.end() ? it->second.active : 0;
}

ServiceStatus StreamService::status() const {
    ServiceStatus out;
    if (manager_) {
        out.ready = manager_->is_ready();
        out.providers = manager_->provider_count();
        out.pools = manager_->stats();
        out.article_cache = manager_->article_cache_stats();
    } else {
        out.ready = !shutdown_.load(std::memory_order_acquire);
    }

    {
        auto lock = std::unique_lock(mutex_);
        out.cached_nzbs = nzb_cache_.size();
    }
    {
        auto lock = std::unique_lock(registry_->mutex);
        out.tracked_mounts = registry_->mounts.size();
    }
    return out;
}

void StreamService::shutdown() noexcept {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) return;

    // After this no stream can queue work on the pool
    gate_->close();

    {
        auto lock = std::unique_lock(mutex_);
        nzb_cache_.clear();
    }
    {
        auto lock = std::unique_lock(registry_->mutex);
        registry_->mounts.clear();
    }
    spdlog::debug("Stream service shut down");
}

} // namespace nzbstream::stream
