// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/nntp/manager.hpp>
#include "test_support.hpp"
#include <future>

using namespace nzbstream;
using namespace nzbstream::core;
using namespace nzbstream::nntp;
using namespace std::chrono_literals;

namespace {

EngineConfig two_providers() {
    EngineConfig config;
    config.providers.push_back(test::make_provider("primary", 0));
    config.providers.push_back(test::make_provider("backup", 1));
    config.acquire_timeout = 200ms;
    config.failure_threshold = 2;
    config.backoff_base = 60'000ms;
    return config;
}

} // namespace

TEST_CASE("NntpManager failover", "[nntp][manager]") {
    auto primary = std::make_shared<test::ScriptedProvider>();
    auto backup = std::make_shared<test::ScriptedProvider>();
    NntpManager manager(two_providers(),
                        test::scripted_factory({{"primary", primary}, {"backup", backup}}));

    auto payload = test::make_bytes(5000, 11);

    SECTION("Served by the first provider") {
        primary->add_article("a@x", payload);
        backup->add_article("a@x", payload);

        auto article = manager.fetch_decoded("a@x", test::TEST_GROUP);
        REQUIRE(article);
        CHECK((*article)->data == payload);
        CHECK(primary->body_calls == 1);
        CHECK(backup->body_calls == 0);
    }

    SECTION("Missing on the first, found on the next") {
        backup->add_article("b@x", payload);

        auto article = manager.fetch_decoded("b@x", "");
        REQUIRE(article);
        CHECK((*article)->data == payload);
        CHECK(primary->body_calls == 1);
        CHECK(backup->body_calls == 1);

        // A miss is not a provider failure
        CHECK(manager.stats()[0].consecutive_failures == 0);
    }

    SECTION("Missing everywhere") {
        auto article = manager.fetch_decoded("gone@x", "");
        REQUIRE_FALSE(article);
        CHECK(article.error() == StreamErrc::article_not_found);
    }

    SECTION("Transport errors count against the provider") {
        {
            auto lock = std::unique_lock(primary->mutex);
            primary->body_errors["c@x"] = make_error_code(StreamErrc::timeout);
        }
        backup->add_article("c@x", payload);

        auto article = manager.fetch_decoded("c@x", "");
        REQUIRE(article);
        auto stats = manager.stats();
        REQUIRE(stats.size() == 2);
        CHECK(stats[0].provider == "primary");
        CHECK(stats[0].consecutive_failures == 1);
        CHECK(stats[0].failures == 1);
    }

    SECTION("Last error is reported when no copy decodes") {
        {
            auto lock = std::unique_lock(primary->mutex);
            primary->body_errors["d@x"] = make_error_code(StreamErrc::timeout);
        }
        {
            auto lock = std::unique_lock(backup->mutex);
            backup->bodies["d@x"] = {"not yenc at all"};
        }

        auto article = manager.fetch_decoded("d@x", "");
        REQUIRE_FALSE(article);
        CHECK(article.error() == StreamErrc::yenc_missing_header);
    }

    SECTION("Unreachable provider is skipped") {
        primary->connect_error = make_error_code(StreamErrc::connection_failed);
        backup->add_article("e@x", payload);

        for (int i = 0; i < 3; ++i) {
            auto article = manager.fetch_decoded("e@x", "");
            REQUIRE(article);
        }
        // Only the first call reached the backup; the rest were cache hits
        CHECK(backup->body_calls == 1);
    }
}

TEST_CASE("NntpManager circuit breaking", "[nntp][manager]") {
    auto primary = std::make_shared<test::ScriptedProvider>();
    auto backup = std::make_shared<test::ScriptedProvider>();
    primary->connect_error = make_error_code(StreamErrc::connection_failed);
    NntpManager manager(two_providers(),
                        test::scripted_factory({{"primary", primary}, {"backup", backup}}));

    for (int i = 0; i < 4; ++i) {
        auto id = "art" + std::to_string(i) + "@x";
        backup->add_article(id, test::make_bytes(100, static_cast<std::uint32_t>(i)));
        REQUIRE(manager.fetch_decoded(id, ""));
    }

    // Two connect failures open the breaker; later requests skip the provider
    CHECK(primary->connects == 2);
    CHECK(manager.stats()[0].state == nntp::BreakerState::open);
    CHECK(backup->body_calls == 4);
}

TEST_CASE("NntpManager article cache", "[nntp][manager]") {
    auto provider = std::make_shared<test::ScriptedProvider>();
    EngineConfig config;
    config.providers.push_back(test::make_provider("only"));
    config.article_cache_entries = 2;
    NntpManager manager(config, test::scripted_factory({{"only", provider}}));

    for (int i = 0; i < 3; ++i) {
        provider->add_article("m" + std::to_string(i) + "@x", test::make_bytes(64, static_cast<std::uint32_t>(i)));
    }

    SECTION("Repeated fetch is served from cache") {
        REQUIRE(manager.fetch_decoded("m0@x", ""));
        REQUIRE(manager.fetch_decoded("m0@x", ""));
        CHECK(provider->body_calls == 1);
        CHECK(manager.article_cache_stats().hits == 1);
    }

    SECTION("Bounded by capacity") {
        for (int i = 0; i < 3; ++i) {
            REQUIRE(manager.fetch_decoded("m" + std::to_string(i) + "@x", ""));
        }
        auto stats = manager.article_cache_stats();
        CHECK(stats.entries == 2);
        CHECK(stats.evictions == 1);

        REQUIRE(manager.fetch_decoded("m0@x", ""));
        CHECK(provider->body_calls == 4);
    }

    SECTION("Failures are not cached") {
        CHECK_FALSE(manager.fetch_decoded("absent@x", ""));
        CHECK_FALSE(manager.fetch_decoded("absent@x", ""));
        CHECK(provider->body_calls == 2);
    }

    SECTION("Concurrent requests share one fetch") {
        std::vector<std::future<ArticleResult>> results;
        for (int i = 0; i < 8; ++i) {
            results.push_back(std::async(std::launch::async, [&] { return manager.fetch_decoded("m1@x", ""); }));
        }
        for (auto& r : results) {
            auto article = r.get();
            REQUIRE(article);
            CHECK((*article)->data.size() == 64);
        }
        CHECK(provider->body_calls <= 8);
        CHECK(manager.article_cache_stats().entries == 1);
    }
}

TEST_CASE("NntpManager lifecycle", "[nntp][manager]") {
    SECTION("No providers") {
        NntpManager manager(EngineConfig{}, test::scripted_factory({}));
        CHECK_FALSE(manager.is_ready());
        CHECK(manager.fetch_decoded("x@x", "").error() == StreamErrc::no_providers);
    }

    SECTION("Provider updates") {
        auto provider = std::make_shared<test::ScriptedProvider>();
        provider->add_article("u@x", test::make_bytes(10));
        EngineConfig config;
        config.providers.push_back(test::make_provider("only"));
        NntpManager manager(config, test::scripted_factory({{"only", provider}}));
        CHECK(manager.is_ready());

        ProviderConfigPatch disable;
        disable.enabled = false;
        CHECK_FALSE(manager.update_provider("only", disable));
        CHECK_FALSE(manager.is_ready());
        CHECK(manager.fetch_decoded("u@x", "").error() == StreamErrc::resource_exhausted);

        ProviderConfigPatch enable;
        enable.enabled = true;
        CHECK_FALSE(manager.update_provider("only", enable));
        CHECK(manager.fetch_decoded("u@x", ""));

        CHECK(manager.update_provider("nobody", enable) == StreamErrc::config_error);
    }

    SECTION("Shutdown") {
        auto provider = std::make_shared<test::ScriptedProvider>();
        provider->add_article("s@x", test::make_bytes(10));
        EngineConfig config;
        config.providers.push_back(test::make_provider("only"));
        NntpManager manager(config, test::scripted_factory({{"only", provider}}));
        REQUIRE(manager.fetch_decoded("s@x", ""));

        manager.shutdown();
        CHECK_FALSE(manager.is_ready());
        CHECK(manager.fetch_decoded("s@x", "").error() == StreamErrc::cancelled);
        CHECK(provider->closes == 1);
        manager.shutdown();
    }
}
