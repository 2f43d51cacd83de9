// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nntp/manager.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace nzbstream::nntp {

using core::StreamErrc;
using core::make_error_code;

namespace {

SessionFactory connection_factory(const core::EngineConfig& config) {
    auto connect_timeout = config.connect_timeout;
    auto io_timeout = config.io_timeout;
    return [connect_timeout, io_timeout](const core::ProviderConfig& provider) -> std::unique_ptr<NntpSession> {
        return std::make_unique<NntpConnection>(provider, connect_timeout, io_timeout);
    };
}

} // namespace

//=============================================================================
// NntpManager
//=============================================================================

NntpManager::NntpManager(const core::EngineConfig& config)
    : NntpManager(config, connection_factory(config)) {}

NntpManager::NntpManager(const core::EngineConfig& config, SessionFactory factory)
    : acquire_timeout_(config.acquire_timeout)
    , cache_(config.article_cache_entries) {
    PoolOptions options{config.failure_threshold, config.backoff_base, config.backoff_max};
    for (const auto& provider : config.providers) {
        pools_.push_back(std::make_unique<NntpPool>(provider, factory, options));
        spdlog::info("Provider {} ({}:{}{}, {} connections, priority {}{})",
                     provider.name, provider.host, provider.port, provider.tls ? ", TLS" : "",
                     provider.max_connections, provider.priority, provider.enabled ? "" : ", disabled");
    }
}

NntpManager::~NntpManager() {
    shutdown();
}

std::vector<NntpPool*> NntpManager::ordered_pools() const {
    std::vector<std::pair<std::uint32_t, NntpPool*>> keyed;
    keyed.reserve(pools_.size());
    for (const auto& pool : pools_) {
        keyed.emplace_back(pool->priority(), pool.get());
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<NntpPool*> ordered;
    ordered.reserve(keyed.size());
    for (const auto& [prio, pool] : keyed) {
        ordered.push_back(pool);
    }
    return ordered;
}

ArticleResult NntpManager::fetch_decoded(const std::string& message_id, const std::string& group) noexcept {
    if (shutdown_.load(std::memory_order_acquire)) {
        return std::unexpected(make_error_code(StreamErrc::cancelled));
    }
    if (pools_.empty()) {
        return std::unexpected(make_error_code(StreamErrc::no_providers));
    }

    std::promise<ArticleResult> promise;
    try {
        auto lock = std::unique_lock(mutex_);
        if (auto cached = cache_.get(message_id)) {
            spdlog::debug("Article cache hit <{}>", message_id);
            return *cached;
        }

        if (auto it = in_flight_.find(message_id); it != in_flight_.end()) {
            auto shared = it->second;
            lock.unlock();
            return shared.get();
        }

        in_flight_.emplace(message_id, promise.get_future().share());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }

    auto result = fetch_uncached(message_id, group);

    {
        auto lock = std::unique_lock(mutex_);
        if (result) {
            try {
                cache_.put(message_id, *result);
            } catch (const std::bad_alloc&) {
                spdlog::warn("Article cache insert failed for <{}>", message_id);
            }
        }
        in_flight_.erase(message_id);
    }

    promise.set_value(result);
    return result;
}

ArticleResult NntpManager::fetch_uncached(const std::string& message_id, const std::string& group) noexcept {
    bool attempted = false;
    bool all_missing = true;
    std::error_code last_error;

    std::vector<NntpPool*> pools;
    try {
        pools = ordered_pools();
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }

    for (auto* pool : pools) {
        if (shutdown_.load(std::memory_order_acquire)) {
            return std::unexpected(make_error_code(StreamErrc::cancelled));
        }
        if (!pool->available()) continue;

        auto lease = pool->acquire(acquire_timeout_);
        if (!lease) {
            // Saturated or backing off: this provider never saw the request
            if (lease.error() == StreamErrc::resource_exhausted || lease.error() == StreamErrc::cancelled) {
                continue;
            }
            attempted = true;
            all_missing = false;
            last_error = lease.error();
            continue;
        }

        attempted = true;
        auto lines = (*lease)->body(message_id, group);
        if (!lines) {
            if (lines.error() == StreamErrc::article_not_found) {
                // The provider answered; only the article is missing
                pool->record_success();
                spdlog::debug("<{}> not on {}, trying next provider", message_id, pool->name());
                last_error = lines.error();
                continue;
            }

            lease->discard();
            pool->record_failure();
            all_missing = false;
            last_error = lines.error();
            spdlog::debug("<{}> failed on {}: {}", message_id, pool->name(), last_error.message());
            continue;
        }

        pool->record_success();
        *lease = NntpPool::Lease{};     // Hand the connection back before decoding

        auto decoded = yenc::decode(*lines);
        if (!decoded) {
            // Another provider may hold an intact copy
            spdlog::warn("<{}> from {} failed to decode: {}", message_id, pool->name(), decoded.error().message());
            all_missing = false;
            last_error = decoded.error();
            continue;
        }

        try {
            return std::make_shared<const yenc::DecodedArticle>(std::move(*decoded));
        } catch (const std::bad_alloc&) {
            return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
        }
    }

    if (!attempted) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
    if (all_missing) {
        return std::unexpected(make_error_code(StreamErrc::article_not_found));
    }
    return std::unexpected(last_error);
}

bool NntpManager::is_ready() const noexcept {
    if (shutdown_.load(std::memory_order_acquire)) return false;
    return std::any_of(pools_.begin(), pools_.end(),
                       [](const auto& pool) { return pool->config().enabled; });
}

std::vector<PoolStats> NntpManager::stats() const {
    std::vector<PoolStats> out;
    out.reserve(pools_.size());
    for (auto* pool : ordered_pools()) {
        out.push_back(pool->stats());
    }
    return out;
}

core::CacheStats NntpManager::article_cache_stats() const {
    auto lock = std::unique_lock(mutex_);
    return cache_.stats();
}

std::error_code NntpManager::update_provider(std::string_view name, const core::ProviderConfigPatch& patch) noexcept {
    for (const auto& pool : pools_) {
        if (pool->name() == name) {
            if (!patch.empty()) pool->reconfigure(patch);
            return {};
        }
    }
    spdlog::warn("No provider named {}", name);
    return make_error_code(StreamErrc::config_error);
}

std::size_t NntpManager::idle_disconnect(std::chrono::seconds max_idle) noexcept {
    std::size_t closed = 0;
    for (const auto& pool : pools_) {
        closed += pool->idle_disconnect(max_idle);
    }
    return closed;
}

void NntpManager::shutdown() noexcept {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) return;

    for (const auto& pool : pools_) {
        pool->shutdown();
    }
    auto lock = std::unique_lock(mutex_);
    cache_.clear();
}

} // namespace nzbstream::nntp
