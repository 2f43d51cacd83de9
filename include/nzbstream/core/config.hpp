// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nzbstream::core {

constexpr std::uint16_t NNTP_PORT = 119;
constexpr std::uint16_t NNTPS_PORT = 563;

constexpr std::uint32_t DEFAULT_MAX_CONNECTIONS = 8;
constexpr std::uint32_t CONNECT_TIMEOUT_MS = 15'000;
constexpr std::uint32_t IO_TIMEOUT_MS = 30'000;
constexpr std::uint32_t ACQUIRE_TIMEOUT_MS = 60'000;
constexpr std::chrono::seconds IDLE_CONNECTION_TIMEOUT{60};

// Circuit breaker
constexpr std::uint32_t FAILURE_THRESHOLD = 3;                  // Consecutive failures before backoff
constexpr std::uint32_t BACKOFF_BASE_MS = 1'000;
constexpr std::uint32_t BACKOFF_MAX_MS = 5 * 60 * 1'000;

constexpr std::size_t ARTICLE_CACHE_ENTRIES = 64;               // Decoded articles kept by the manager
constexpr std::size_t SEGMENT_CACHE_ENTRIES = 32;               // Decoded segments kept per stream
constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

constexpr std::chrono::seconds NZB_CACHE_TTL{60 * 60};
constexpr std::chrono::seconds STREAM_CLEANUP_DELAY{2 * 60};

// Critical segments warmed into the persistent cache (container headers / cues)
constexpr std::uint32_t TAIL_SEGMENTS_COUNT = 3;

// Seek detection
constexpr std::uint32_t SEEK_JUMP_THRESHOLD = 5;
constexpr std::uint32_t SEEK_RELEVANT_MARGIN = 2;

enum class AccessPattern : std::uint8_t {
    sequential,
    random,
    idle,
};

enum class PrefetchPriority : std::uint8_t {
    high,
    low,
    background,
};

struct PrefetchStrategy {
    std::uint32_t window_size{0};
    PrefetchPriority priority{PrefetchPriority::background};
};

struct PrefetchConfig {
    // Indexed by AccessPattern
    std::array<PrefetchStrategy, 3> strategies{{
        {10, PrefetchPriority::high},       // sequential
        {2, PrefetchPriority::low},         // random
        {5, PrefetchPriority::background},  // idle
    }};
    std::uint32_t pattern_window_size{5};   // Accesses considered for pattern detection
    double sequential_threshold{0.8};       // Share of small deltas needed for sequential
    double random_threshold{0.3};           // Below this share the pattern is random

    [[nodiscard]] const PrefetchStrategy& strategy(AccessPattern p) const noexcept {
        return strategies[static_cast<std::size_t>(p)];
    }
};

// One upstream Usenet provider
struct ProviderConfig {
    std::string name;
    std::string host;
    std::uint16_t port{NNTP_PORT};
    bool tls{false};
    std::string username;
    std::string password;
    std::uint32_t max_connections{DEFAULT_MAX_CONNECTIONS};
    std::uint32_t priority{0};              // Lower is tried first
    bool enabled{true};
    bool join_group{false};                 // Issue GROUP before BODY
};

// Partial update for a running provider; absent fields stay untouched
struct ProviderConfigPatch {
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<bool> tls;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::uint32_t> max_connections;
    std::optional<std::uint32_t> priority;
    std::optional<bool> enabled;
    std::optional<bool> join_group;

    [[nodiscard]] bool empty() const noexcept;

    // True if applying this patch invalidates open connections
    [[nodiscard]] bool affects_connections() const noexcept;
};

// Apply only the fields present in the patch
void apply_patch(ProviderConfig& config, const ProviderConfigPatch& patch) noexcept;

struct EngineConfig {
    std::vector<ProviderConfig> providers;

    std::uint32_t worker_threads{0};        // 0 = sum of provider connection ceilings
    std::size_t article_cache_entries{ARTICLE_CACHE_ENTRIES};
    std::size_t segment_cache_entries{SEGMENT_CACHE_ENTRIES};
    std::string cache_db_path;              // Empty disables the persistent segment cache

    std::chrono::milliseconds connect_timeout{CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds io_timeout{IO_TIMEOUT_MS};
    std::chrono::milliseconds acquire_timeout{ACQUIRE_TIMEOUT_MS};

    std::uint32_t failure_threshold{FAILURE_THRESHOLD};
    std::chrono::milliseconds backoff_base{BACKOFF_BASE_MS};
    std::chrono::milliseconds backoff_max{BACKOFF_MAX_MS};

    std::chrono::seconds nzb_cache_ttl{NZB_CACHE_TTL};
    std::chrono::seconds stream_cleanup_delay{STREAM_CLEANUP_DELAY};

    PrefetchConfig prefetch;

    // Worker threads actually used for fetches
    [[nodiscard]] std::uint32_t effective_worker_threads() const noexcept;
};

// Parse a JSON configuration document
[[nodiscard]] std::expected<EngineConfig, std::error_code>
parse_config(std::string_view json_text) noexcept;

// Load a JSON configuration file
[[nodiscard]] std::expected<EngineConfig, std::error_code>
load_config(std::string_view path) noexcept;

// Parse a JSON object into a provider patch (only present keys are set)
[[nodiscard]] std::expected<ProviderConfigPatch, std::error_code>
parse_provider_patch(std::string_view json_text) noexcept;

[[nodiscard]] std::string_view to_string(AccessPattern pattern) noexcept;
[[nodiscard]] std::string_view to_string(PrefetchPriority priority) noexcept;

} // namespace nzbstream::core
