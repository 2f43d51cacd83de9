// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/core/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace nzbstream::core {

namespace {

using json = nlohmann::json;

std::expected<PrefetchPriority, std::error_code> parse_priority(const std::string& value) noexcept {
    if (value == "high") return PrefetchPriority::high;
    if (value == "low") return PrefetchPriority::low;
    if (value == "background") return PrefetchPriority::background;
    return std::unexpected(make_error_code(StreamErrc::config_error));
}

std::expected<ProviderConfig, std::error_code> parse_provider(const json& j) {
    ProviderConfig p;
    p.host = j.value("host", std::string{});
    if (p.host.empty()) {
        spdlog::error("Provider entry without host");
        return std::unexpected(make_error_code(StreamErrc::config_error));
    }

    p.name = j.value("name", p.host);
    p.tls = j.value("tls", false);
    p.port = j.value("port", static_cast<std::uint16_t>(p.tls ? NNTPS_PORT : NNTP_PORT));
    p.username = j.value("username", std::string{});
    p.password = j.value("password", std::string{});
    p.max_connections = j.value("maxConnections", DEFAULT_MAX_CONNECTIONS);
    p.priority = j.value("priority", 0u);
    p.enabled = j.value("enabled", true);
    p.join_group = j.value("joinGroup", false);

    if (p.max_connections == 0) {
        spdlog::error("Provider {} has maxConnections = 0", p.name);
        return std::unexpected(make_error_code(StreamErrc::config_error));
    }
    return p;
}

std::error_code parse_prefetch(const json& j, PrefetchConfig& cfg) {
    cfg.pattern_window_size = j.value("patternWindowSize", cfg.pattern_window_size);
    cfg.sequential_threshold = j.value("sequentialThreshold", cfg.sequential_threshold);
    cfg.random_threshold = j.value("randomThreshold", cfg.random_threshold);

    if (cfg.pattern_window_size < 2 ||
        cfg.sequential_threshold <= 0.0 || cfg.sequential_threshold > 1.0 ||
        cfg.random_threshold < 0.0 || cfg.random_threshold > cfg.sequential_threshold) {
        return make_error_code(StreamErrc::config_error);
    }

    if (j.contains("strategies") && j["strategies"].is_object()) {
        const auto& s = j["strategies"];
        constexpr std::array<std::pair<const char*, AccessPattern>, 3> names{{
            {"sequential", AccessPattern::sequential},
            {"random", AccessPattern::random},
            {"idle", AccessPattern::idle},
        }};
        for (const auto& [name, pattern] : names) {
            if (!s.contains(name)) continue;
            auto& strategy = cfg.strategies[static_cast<std::size_t>(pattern)];
            strategy.window_size = s[name].value("windowSize", strategy.window_size);
            if (s[name].contains("priority")) {
                auto prio = parse_priority(s[name]["priority"].get<std::string>());
                if (!prio) return prio.error();
                strategy.priority = *prio;
            }
        }
    }
    return {};
}

} // namespace

//=============================================================================
// ProviderConfigPatch
//=============================================================================

bool ProviderConfigPatch::empty() const noexcept {
    return !host && !port && !tls && !username && !password &&
           !max_connections && !priority && !enabled && !join_group;
}

bool ProviderConfigPatch::affects_connections() const noexcept {
    return host || port || tls || username || password;
}

void apply_patch(ProviderConfig& config, const ProviderConfigPatch& patch) noexcept {
    if (patch.host) config.host = *patch.host;
    if (patch.port) config.port = *patch.port;
    if (patch.tls) config.tls = *patch.tls;
    if (patch.username) config.username = *patch.username;
    if (patch.password) config.password = *patch.password;
    if (patch.max_connections && *patch.max_connections > 0) config.max_connections = *patch.max_connections;
    if (patch.priority) config.priority = *patch.priority;
    if (patch.enabled) config.enabled = *patch.enabled;
    if (patch.join_group) config.join_group = *patch.join_group;
}

//=============================================================================
// EngineConfig
//=============================================================================

std::uint32_t EngineConfig::effective_worker_threads() const noexcept {
    if (worker_threads > 0) return worker_threads;

    std::uint32_t total = 0;
    for (const auto& p : providers) {
        if (p.enabled) total += p.max_connections;
    }
    return total > 0 ? total : 4;
}

std::expected<EngineConfig, std::error_code>
parse_config(std::string_view json_text) noexcept {
    try {
        auto j = json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(StreamErrc::config_error));
        }

        EngineConfig cfg;

        if (j.contains("providers")) {
            if (!j["providers"].is_array()) {
                return std::unexpected(make_error_code(StreamErrc::config_error));
            }
            for (const auto& entry : j["providers"]) {
                auto provider = parse_provider(entry);
                if (!provider) return std::unexpected(provider.error());
                cfg.providers.push_back(std::move(*provider));
            }
        }

        cfg.worker_threads = j.value("workerThreads", cfg.worker_threads);
        cfg.article_cache_entries = j.value("articleCacheEntries", cfg.article_cache_entries);
        cfg.segment_cache_entries = j.value("segmentCacheEntries", cfg.segment_cache_entries);
        cfg.cache_db_path = j.value("cacheDbPath", cfg.cache_db_path);

        cfg.connect_timeout = std::chrono::milliseconds{j.value("connectTimeoutMs", CONNECT_TIMEOUT_MS)};
        cfg.io_timeout = std::chrono::milliseconds{j.value("ioTimeoutMs", IO_TIMEOUT_MS)};
        cfg.acquire_timeout = std::chrono::milliseconds{j.value("acquireTimeoutMs", ACQUIRE_TIMEOUT_MS)};

        cfg.failure_threshold = j.value("failureThreshold", cfg.failure_threshold);
        cfg.backoff_base = std::chrono::milliseconds{j.value("backoffBaseMs", BACKOFF_BASE_MS)};
        cfg.backoff_max = std::chrono::milliseconds{j.value("backoffMaxMs", BACKOFF_MAX_MS)};

        cfg.nzb_cache_ttl = std::chrono::seconds{
            j.value("nzbCacheTtlSeconds", static_cast<std::int64_t>(NZB_CACHE_TTL.count()))};
        cfg.stream_cleanup_delay = std::chrono::seconds{
            j.value("streamCleanupDelaySeconds", static_cast<std::int64_t>(STREAM_CLEANUP_DELAY.count()))};

        if (j.contains("prefetch")) {
            if (auto ec = parse_prefetch(j["prefetch"], cfg.prefetch)) {
                return std::unexpected(ec);
            }
        }

        if (cfg.segment_cache_entries == 0 || cfg.failure_threshold == 0) {
            return std::unexpected(make_error_code(StreamErrc::config_error));
        }

        return cfg;
    } catch (const json::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return std::unexpected(make_error_code(StreamErrc::config_error));
    } catch (const std::exception& e) {
        spdlog::error("Configuration error: {}", e.what());
        return std::unexpected(make_error_code(StreamErrc::config_error));
    }
}

std::expected<EngineConfig, std::error_code>
load_config(std::string_view path) noexcept {
    try {
        std::ifstream file(std::string(path), std::ios::binary);
        if (!file) {
            spdlog::error("Cannot open configuration file {}", path);
            return std::unexpected(make_error_code(StreamErrc::io_error));
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_config(ss.str());
    } catch (const std::exception& e) {
        spdlog::error("Reading configuration {} failed: {}", path, e.what());
        return std::unexpected(make_error_code(StreamErrc::io_error));
    }
}

std::expected<ProviderConfigPatch, std::error_code>
parse_provider_patch(std::string_view json_text) noexcept {
    try {
        auto j = json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(StreamErrc::config_error));
        }

        ProviderConfigPatch patch;
        if (j.contains("host")) patch.host = j["host"].get<std::string>();
        if (j.contains("port")) patch.port = j["port"].get<std::uint16_t>();
        if (j.contains("tls")) patch.tls = j["tls"].get<bool>();
        if (j.contains("username")) patch.username = j["username"].get<std::string>();
        if (j.contains("password")) patch.password = j["password"].get<std::string>();
        if (j.contains("maxConnections")) patch.max_connections = j["maxConnections"].get<std::uint32_t>();
        if (j.contains("priority")) patch.priority = j["priority"].get<std::uint32_t>();
        if (j.contains("enabled")) patch.enabled = j["enabled"].get<bool>();
        if (j.contains("joinGroup")) patch.join_group = j["joinGroup"].get<bool>();
        return patch;
    } catch (const json::exception& e) {
        spdlog::error("Invalid provider patch: {}", e.what());
        return std::unexpected(make_error_code(StreamErrc::config_error));
    }
}

std::string_view to_string(AccessPattern pattern) noexcept {
    switch (pattern) {
        case AccessPattern::sequential: return "sequential";
        case AccessPattern::random:     return "random";
        case AccessPattern::idle:       return "idle";
    }
    return "unknown";
}

std::string_view to_string(PrefetchPriority priority) noexcept {
    switch (priority) {
        case PrefetchPriority::high:       return "high";
        case PrefetchPriority::low:        return "low";
        case PrefetchPriority::background: return "background";
    }
    return "unknown";
}

} // namespace nzbstream::core
