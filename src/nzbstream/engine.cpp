// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/engine.hpp>
#include <spdlog/spdlog.h>

namespace nzbstream {

using core::StreamErrc;
using core::make_error_code;

namespace {

std::expected<std::unique_ptr<stream::SegmentCacheService>, std::error_code>
open_cache(const core::EngineConfig& config) {
    if (config.cache_db_path.empty()) {
        spdlog::debug("Persistent segment cache disabled");
        return nullptr;
    }
    return stream::SegmentCacheService::open(config.cache_db_path);
}

} // namespace

std::expected<std::unique_ptr<Engine>, std::error_code> Engine::create(core::EngineConfig config) {
    auto cache = open_cache(config);
    if (!cache) {
        return std::unexpected(cache.error());
    }
    auto manager = std::make_unique<nntp::NntpManager>(config);
    return std::unique_ptr<Engine>(new Engine(std::move(config), std::move(manager), std::move(*cache)));
}

std::expected<std::unique_ptr<Engine>, std::error_code>
Engine::create(core::EngineConfig config, nntp::SessionFactory factory) {
    auto cache = open_cache(config);
    if (!cache) {
        return std::unexpected(cache.error());
    }
    auto manager = std::make_unique<nntp::NntpManager>(config, std::move(factory));
    return std::unique_ptr<Engine>(new Engine(std::move(config), std::move(manager), std::move(*cache)));
}

Engine::Engine(core::EngineConfig config, std::unique_ptr<nntp::NntpManager> manager,
               std::unique_ptr<stream::SegmentCacheService> cache)
    : config_(std::move(config))
    , manager_(std::move(manager))
    , cache_(std::move(cache))
    , workers_(config_.effective_worker_threads())
    , service_(*manager_, workers_, mounts_, cache_.get(),
               stream::StreamServiceOptions::from(config_), manager_.get()) {
    spdlog::debug("Engine started: {} providers, {} workers, persistent cache {}", manager_->provider_count(),
                  config_.effective_worker_threads(), cache_ ? cache_->path() : std::string("off"));
}

Engine::~Engine() {
    shutdown();
}

std::string Engine::mount(const nzb::ParsedNzb& parsed, std::string title) {
    auto id = mounts_.add(parsed, std::move(title));
    service_.cache_nzb(parsed.hash, parsed);
    return id;
}

std::expected<stream::CriticalPrefetchResult, std::error_code>
Engine::warm(std::string_view mount_id, std::uint32_t file_index) {
    if (!cache_) {
        return std::unexpected(make_error_code(StreamErrc::config_error));
    }

    auto mount = mounts_.get_mount(mount_id);
    if (!mount) {
        return std::unexpected(make_error_code(StreamErrc::mount_not_found));
    }

    const nzb::NzbFile* file = nullptr;
    for (const auto& candidate : mount->media_files) {
        if (candidate.index == file_index) {
            file = &candidate;
            break;
        }
    }
    if (!file) {
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }

    if (!manager_->is_ready()) {
        spdlog::warn("No enabled provider; skipping warm-up of {}", file->name);
        return std::unexpected(make_error_code(StreamErrc::no_providers));
    }

    return cache_->prefetch_critical_segments(mount_id, file_index, *file, *manager_);
}

void Engine::shutdown() noexcept {
    if (shut_down_) return;
    shut_down_ = true;

    service_.shutdown();
    manager_->shutdown();   // Queued fetches now fail fast
    workers_.join();
    spdlog::debug("Engine stopped");
}

} // namespace nzbstream
