// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/core/lru_cache.hpp>
#include <nzbstream/nntp/article_source.hpp>
#include <nzbstream/nntp/pool.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nzbstream::nntp {

// Fetches articles across all configured providers with failover
class NntpManager final : public ArticleSource {
public:
    // Real NNTP connections
    explicit NntpManager(const core::EngineConfig& config);

    // Custom session factory (tests, proxies)
    NntpManager(const core::EngineConfig& config, SessionFactory factory);

    ~NntpManager() override;

    NntpManager(const NntpManager&) = delete;
    NntpManager& operator=(const NntpManager&) = delete;

    // Providers are tried in priority order. A miss moves on to the next
    // provider; connection failures count against the provider's health.
    // Concurrent requests for the same message-ID share one fetch.
    [[nodiscard]] ArticleResult
    fetch_decoded(const std::string& message_id, const std::string& group) noexcept override;

    // At least one enabled provider
    [[nodiscard]] bool is_ready() const noexcept;
    [[nodiscard]] std::size_t provider_count() const noexcept { return pools_.size(); }

    [[nodiscard]] std::vector<PoolStats> stats() const;
    [[nodiscard]] core::CacheStats article_cache_stats() const;

    // Partial update of one running provider
    [[nodiscard]] std::error_code
    update_provider(std::string_view name, const core::ProviderConfigPatch& patch) noexcept;

    // Close connections idle longer than max_idle
    std::size_t idle_disconnect(std::chrono::seconds max_idle = core::IDLE_CONNECTION_TIMEOUT) noexcept;

    void shutdown() noexcept;

private:
    [[nodiscard]] ArticleResult fetch_uncached(const std::string& message_id, const std::string& group) noexcept;

    // Pools sorted by current priority
    [[nodiscard]] std::vector<NntpPool*> ordered_pools() const;

    std::vector<std::unique_ptr<NntpPool>> pools_;
    std::chrono::milliseconds acquire_timeout_;

    core::LruCache<std::string, ArticlePtr> cache_;
    std::unordered_map<std::string, std::shared_future<ArticleResult>> in_flight_;
    std::atomic<bool> shutdown_{false};
    mutable std::mutex mutex_;
};

} // namespace nzbstream::nntp
