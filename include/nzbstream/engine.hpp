// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/nntp/manager.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <nzbstream/stream/mount.hpp>
#include <nzbstream/stream/segment_cache.hpp>
#include <nzbstream/stream/stream_service.hpp>
#include <boost/asio/thread_pool.hpp>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace nzbstream {

// Owns every long-lived service and wires them together by reference.
// Construct one per process.
class Engine {
public:
    // Opens the persistent cache when cache_db_path is set
    [[nodiscard]] static std::expected<std::unique_ptr<Engine>, std::error_code>
    create(core::EngineConfig config);

    // Custom NNTP session factory (tests, proxies)
    [[nodiscard]] static std::expected<std::unique_ptr<Engine>, std::error_code>
    create(core::EngineConfig config, nntp::SessionFactory factory);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Register a parsed NZB as a ready mount; returns the mount id
    std::string mount(const nzb::ParsedNzb& parsed, std::string title);

    // Pull the first and last segments of a file into the persistent cache
    [[nodiscard]] std::expected<stream::CriticalPrefetchResult, std::error_code>
    warm(std::string_view mount_id, std::uint32_t file_index);

    [[nodiscard]] const core::EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] nntp::NntpManager& manager() noexcept { return *manager_; }
    [[nodiscard]] stream::SegmentCacheService* cache() noexcept { return cache_.get(); }
    [[nodiscard]] stream::MemoryMountRepository& mounts() noexcept { return mounts_; }
    [[nodiscard]] stream::StreamService& service() noexcept { return service_; }
    [[nodiscard]] boost::asio::thread_pool& workers() noexcept { return workers_; }

    // Stop streams and providers, then wait for the workers
    void shutdown() noexcept;

private:
    Engine(core::EngineConfig config, std::unique_ptr<nntp::NntpManager> manager,
           std::unique_ptr<stream::SegmentCacheService> cache);

    // Declaration order is construction order
    core::EngineConfig config_;
    std::unique_ptr<nntp::NntpManager> manager_;
    std::unique_ptr<stream::SegmentCacheService> cache_;
    boost::asio::thread_pool workers_;
    stream::MemoryMountRepository mounts_;
    stream::StreamService service_;
    bool shut_down_{false};
};

} // namespace nzbstream
