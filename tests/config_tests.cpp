// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/core/config.hpp>
#include "test_support.hpp"
#include <fstream>

using namespace nzbstream::core;

TEST_CASE("Config defaults", "[config]") {
    EngineConfig cfg;

    SECTION("Prefetch strategies") {
        CHECK(cfg.prefetch.strategy(AccessPattern::sequential).window_size == 10);
        CHECK(cfg.prefetch.strategy(AccessPattern::sequential).priority == PrefetchPriority::high);
        CHECK(cfg.prefetch.strategy(AccessPattern::random).window_size == 2);
        CHECK(cfg.prefetch.strategy(AccessPattern::random).priority == PrefetchPriority::low);
        CHECK(cfg.prefetch.strategy(AccessPattern::idle).window_size == 5);
        CHECK(cfg.prefetch.strategy(AccessPattern::idle).priority == PrefetchPriority::background);
        CHECK(cfg.prefetch.pattern_window_size == 5);
        CHECK(cfg.prefetch.sequential_threshold == Catch::Approx(0.8));
        CHECK(cfg.prefetch.random_threshold == Catch::Approx(0.3));
    }

    SECTION("Worker threads follow provider connection ceilings") {
        CHECK(cfg.effective_worker_threads() == 4);

        ProviderConfig a;
        a.max_connections = 10;
        ProviderConfig b;
        b.max_connections = 6;
        ProviderConfig c;
        c.max_connections = 50;
        c.enabled = false;
        cfg.providers = {a, b, c};
        CHECK(cfg.effective_worker_threads() == 16);

        cfg.worker_threads = 3;
        CHECK(cfg.effective_worker_threads() == 3);
    }

    SECTION("Cache and timing constants") {
        CHECK(cfg.segment_cache_entries == SEGMENT_CACHE_ENTRIES);
        CHECK(cfg.nzb_cache_ttl == std::chrono::hours(1));
        CHECK(cfg.stream_cleanup_delay == std::chrono::minutes(2));
        CHECK(cfg.cache_db_path.empty());
    }
}

TEST_CASE("parse_config", "[config]") {
    SECTION("Full document") {
        auto cfg = parse_config(R"({
            "providers": [
                {"name": "primary", "host": "news.example.com", "tls": true,
                 "username": "u", "password": "p", "maxConnections": 20, "priority": 0},
                {"host": "backup.example.net", "port": 8119, "priority": 1, "joinGroup": true}
            ],
            "workerThreads": 12,
            "segmentCacheEntries": 64,
            "cacheDbPath": "/var/cache/nzbstream.db",
            "ioTimeoutMs": 5000,
            "nzbCacheTtlSeconds": 120,
            "prefetch": {
                "patternWindowSize": 8,
                "strategies": {"sequential": {"windowSize": 16, "priority": "low"}}
            }
        })");
        REQUIRE(cfg);
        REQUIRE(cfg->providers.size() == 2);

        const auto& primary = cfg->providers[0];
        CHECK(primary.name == "primary");
        CHECK(primary.tls);
        CHECK(primary.port == NNTPS_PORT);
        CHECK(primary.max_connections == 20);

        const auto& backup = cfg->providers[1];
        CHECK(backup.name == "backup.example.net");
        CHECK(backup.port == 8119);
        CHECK_FALSE(backup.tls);
        CHECK(backup.join_group);
        CHECK(backup.max_connections == DEFAULT_MAX_CONNECTIONS);

        CHECK(cfg->worker_threads == 12);
        CHECK(cfg->segment_cache_entries == 64);
        CHECK(cfg->cache_db_path == "/var/cache/nzbstream.db");
        CHECK(cfg->io_timeout == std::chrono::milliseconds(5000));
        CHECK(cfg->nzb_cache_ttl == std::chrono::seconds(120));
        CHECK(cfg->prefetch.pattern_window_size == 8);
        CHECK(cfg->prefetch.strategy(AccessPattern::sequential).window_size == 16);
        CHECK(cfg->prefetch.strategy(AccessPattern::sequential).priority == PrefetchPriority::low);
        CHECK(cfg->prefetch.strategy(AccessPattern::random).window_size == 2);
    }

    SECTION("Empty object keeps defaults") {
        auto cfg = parse_config("{}");
        REQUIRE(cfg);
        CHECK(cfg->providers.empty());
        CHECK(cfg->article_cache_entries == ARTICLE_CACHE_ENTRIES);
    }

    SECTION("Rejected documents") {
        CHECK(parse_config("not json").error() == StreamErrc::config_error);
        CHECK(parse_config("[1, 2]").error() == StreamErrc::config_error);
        CHECK(parse_config(R"({"providers": [{"name": "nohost"}]})").error() == StreamErrc::config_error);
        CHECK(parse_config(R"({"providers": [{"host": "h", "maxConnections": 0}]})").error() == StreamErrc::config_error);
        CHECK(parse_config(R"({"prefetch": {"patternWindowSize": 1}})").error() == StreamErrc::config_error);
        CHECK(parse_config(R"({"prefetch": {"strategies": {"idle": {"priority": "urgent"}}}})").error()
              == StreamErrc::config_error);
        CHECK(parse_config(R"({"segmentCacheEntries": 0})").error() == StreamErrc::config_error);
    }
}

TEST_CASE("load_config", "[config]") {
    SECTION("Missing file") {
        auto cfg = load_config("/nonexistent/nzbstream.json");
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error() == StreamErrc::io_error);
    }

    SECTION("File on disk") {
        nzbstream::test::TempPath path("nzbstream-config");
        {
            std::ofstream out(path.path());
            out << R"({"providers": [{"host": "news.example.com"}], "workerThreads": 2})";
        }
        auto cfg = load_config(path.string());
        REQUIRE(cfg);
        CHECK(cfg->providers.size() == 1);
        CHECK(cfg->worker_threads == 2);
    }
}

TEST_CASE("Provider patches", "[config]") {
    ProviderConfig provider;
    provider.name = "primary";
    provider.host = "old.example.com";
    provider.max_connections = 8;

    SECTION("Only present fields change") {
        auto patch = parse_provider_patch(R"({"maxConnections": 4, "priority": 2})");
        REQUIRE(patch);
        CHECK_FALSE(patch->empty());
        CHECK_FALSE(patch->affects_connections());

        apply_patch(provider, *patch);
        CHECK(provider.max_connections == 4);
        CHECK(provider.priority == 2);
        CHECK(provider.host == "old.example.com");
    }

    SECTION("Connection settings are flagged") {
        auto patch = parse_provider_patch(R"({"host": "new.example.com"})");
        REQUIRE(patch);
        CHECK(patch->affects_connections());
        apply_patch(provider, *patch);
        CHECK(provider.host == "new.example.com");
    }

    SECTION("Zero connections are ignored") {
        ProviderConfigPatch patch;
        patch.max_connections = 0;
        apply_patch(provider, patch);
        CHECK(provider.max_connections == 8);
    }

    SECTION("Empty and invalid patches") {
        auto empty = parse_provider_patch("{}");
        REQUIRE(empty);
        CHECK(empty->empty());
        CHECK_FALSE(parse_provider_patch(R"({"port": "abc"})"));
    }
}

TEST_CASE("Enum names", "[config]") {
    CHECK(to_string(AccessPattern::sequential) == "sequential");
    CHECK(to_string(AccessPattern::random) == "random");
    CHECK(to_string(AccessPattern::idle) == "idle");
    CHECK(to_string(PrefetchPriority::high) == "high");
    CHECK(to_string(PrefetchPriority::background) == "background");
}
