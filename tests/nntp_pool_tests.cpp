// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/nntp/pool.hpp>
#include "test_support.hpp"
#include <thread>

using namespace nzbstream;
using namespace nzbstream::core;
using namespace nzbstream::nntp;
using namespace std::chrono_literals;

TEST_CASE("ProviderHealth circuit breaker", "[nntp][health]") {
    ProviderHealth health(3, 1000ms, 8000ms);
    auto now = ProviderHealth::Clock::now();

    SECTION("Stays closed below the threshold") {
        health.record_failure(now);
        health.record_failure(now);
        CHECK(health.state(now) == BreakerState::closed);
        CHECK(health.allow_request(now));
        CHECK(health.backoff() == 0ms);
    }

    SECTION("Opens at the threshold") {
        for (int i = 0; i < 3; ++i) health.record_failure(now);
        CHECK(health.state(now) == BreakerState::open);
        CHECK_FALSE(health.allow_request(now));
        CHECK(health.backoff() == 1000ms);
        CHECK(health.backoff_until() == now + 1000ms);
    }

    SECTION("Backoff doubles and is capped") {
        for (int i = 0; i < 4; ++i) health.record_failure(now);
        CHECK(health.backoff() == 2000ms);
        health.record_failure(now);
        CHECK(health.backoff() == 4000ms);
        health.record_failure(now);
        CHECK(health.backoff() == 8000ms);
        for (int i = 0; i < 10; ++i) health.record_failure(now);
        CHECK(health.backoff() == 8000ms);
    }

    SECTION("Half-open allows a single probe") {
        for (int i = 0; i < 3; ++i) health.record_failure(now);
        auto later = now + 1500ms;
        CHECK(health.state(later) == BreakerState::half_open);
        CHECK(health.allow_request(later));
        CHECK_FALSE(health.allow_request(later));

        health.release_probe();
        CHECK(health.allow_request(later));
    }

    SECTION("Failed probe reopens with a longer backoff") {
        for (int i = 0; i < 3; ++i) health.record_failure(now);
        auto later = now + 1500ms;
        REQUIRE(health.allow_request(later));
        health.record_failure(later);
        CHECK(health.state(later) == BreakerState::open);
        CHECK(health.backoff_until() == later + 2000ms);
    }

    SECTION("Success resets") {
        for (int i = 0; i < 5; ++i) health.record_failure(now);
        health.record_success();
        CHECK(health.consecutive_failures() == 0);
        CHECK(health.state(now) == BreakerState::closed);
    }

    SECTION("State names") {
        CHECK(to_string(BreakerState::closed) == "closed");
        CHECK(to_string(BreakerState::open) == "open");
        CHECK(to_string(BreakerState::half_open) == "half_open");
    }
}

TEST_CASE("NntpPool leases", "[nntp][pool]") {
    auto provider = std::make_shared<test::ScriptedProvider>();
    NntpPool pool(test::make_provider("alpha", 0, 2), test::scripted_factory({{"alpha", provider}}));

    SECTION("Sessions open lazily and are reused") {
        CHECK(pool.stats().open == 0);
        {
            auto lease = pool.acquire(100ms);
            REQUIRE(lease);
            CHECK(provider->connects == 1);
            CHECK(pool.stats().in_use == 1);
        }
        CHECK(pool.stats().idle == 1);

        auto again = pool.acquire(100ms);
        REQUIRE(again);
        CHECK(provider->connects == 1);
        CHECK(pool.stats().requests == 2);
    }

    SECTION("Saturation times out") {
        auto a = pool.acquire(100ms);
        auto b = pool.acquire(100ms);
        REQUIRE(a);
        REQUIRE(b);

        auto c = pool.acquire(20ms);
        REQUIRE_FALSE(c);
        CHECK(c.error() == StreamErrc::resource_exhausted);
        CHECK(pool.stats().open == 2);
    }

    SECTION("A returned session wakes a waiter") {
        auto a = pool.acquire(100ms);
        auto b = pool.acquire(100ms);
        REQUIRE(a);
        REQUIRE(b);

        std::thread releaser([&] {
            std::this_thread::sleep_for(20ms);
            *a = NntpPool::Lease{};
        });
        auto c = pool.acquire(2000ms);
        releaser.join();
        CHECK(c);
        CHECK(provider->connects == 2);
    }

    SECTION("Discarded sessions are closed and not reused") {
        {
            auto lease = pool.acquire(100ms);
            REQUIRE(lease);
            lease->discard();
        }
        CHECK(provider->closes == 1);
        CHECK(pool.stats().open == 0);

        auto again = pool.acquire(100ms);
        REQUIRE(again);
        CHECK(provider->connects == 2);
    }

    SECTION("Broken sessions are dropped on return") {
        {
            auto lock = std::unique_lock(provider->mutex);
            provider->body_errors["bad@x"] = make_error_code(StreamErrc::connection_closed);
        }
        {
            auto lease = pool.acquire(100ms);
            REQUIRE(lease);
            CHECK_FALSE((*lease)->body("bad@x", ""));
        }
        CHECK(pool.stats().open == 0);
        CHECK(pool.stats().idle == 0);
    }

    SECTION("Shutdown cancels") {
        pool.shutdown();
        auto lease = pool.acquire(100ms);
        REQUIRE_FALSE(lease);
        CHECK(lease.error() == StreamErrc::cancelled);
        CHECK_FALSE(pool.available());
    }
}

TEST_CASE("NntpPool connect failures", "[nntp][pool]") {
    auto provider = std::make_shared<test::ScriptedProvider>();
    provider->connect_error = make_error_code(StreamErrc::auth_failed);

    PoolOptions options{2, 60'000ms, 60'000ms};
    NntpPool pool(test::make_provider("beta"), test::scripted_factory({{"beta", provider}}), options);

    auto first = pool.acquire(100ms);
    REQUIRE_FALSE(first);
    CHECK(first.error() == StreamErrc::auth_failed);
    CHECK(pool.stats().open == 0);
    CHECK(pool.available());

    auto second = pool.acquire(100ms);
    CHECK(second.error() == StreamErrc::auth_failed);

    SECTION("Backing off after the threshold") {
        CHECK_FALSE(pool.available());
        CHECK(pool.stats().state == BreakerState::open);
        auto third = pool.acquire(100ms);
        CHECK(third.error() == StreamErrc::resource_exhausted);
        CHECK(provider->connects == 2);
    }

    SECTION("Reconfiguring connection settings clears the breaker") {
        provider->connect_error = {};
        ProviderConfigPatch patch;
        patch.password = "fixed";
        pool.reconfigure(patch);
        CHECK(pool.available());
        CHECK(pool.acquire(100ms));
        CHECK(pool.config().password == "fixed");
    }

    SECTION("Unknown provider in the factory") {
        NntpPool orphan(test::make_provider("gamma"), test::scripted_factory({}));
        auto lease = orphan.acquire(100ms);
        REQUIRE_FALSE(lease);
        CHECK(lease.error() == StreamErrc::connection_failed);
    }
}

TEST_CASE("NntpPool maintenance", "[nntp][pool]") {
    auto provider = std::make_shared<test::ScriptedProvider>();
    NntpPool pool(test::make_provider("alpha", 3, 4), test::scripted_factory({{"alpha", provider}}));

    {
        auto a = pool.acquire(100ms);
        auto b = pool.acquire(100ms);
        REQUIRE(a);
        REQUIRE(b);
    }
    REQUIRE(pool.stats().idle == 2);

    SECTION("Idle disconnect") {
        CHECK(pool.idle_disconnect(std::chrono::seconds{3600}) == 0);
        CHECK(pool.idle_disconnect(std::chrono::seconds{0}) == 2);
        CHECK(pool.stats().open == 0);
        CHECK(provider->closes == 2);
    }

    SECTION("Connection settings drain idle sessions") {
        ProviderConfigPatch patch;
        patch.host = "other.example";
        pool.reconfigure(patch);
        CHECK(pool.stats().open == 0);
        CHECK(provider->closes == 2);
        CHECK(pool.config().host == "other.example");
    }

    SECTION("Lent sessions from an old generation are not pooled") {
        auto lease = pool.acquire(100ms);
        REQUIRE(lease);
        ProviderConfigPatch patch;
        patch.port = 563;
        pool.reconfigure(patch);
        *lease = NntpPool::Lease{};
        CHECK(pool.stats().open == 0);
    }

    SECTION("Priority and limits keep sessions") {
        ProviderConfigPatch patch;
        patch.priority = 1;
        patch.max_connections = 6;
        pool.reconfigure(patch);
        CHECK(pool.stats().idle == 2);
        CHECK(pool.priority() == 1);
        CHECK(pool.stats().max_connections == 6);
    }

    SECTION("Disabling refuses new leases") {
        ProviderConfigPatch patch;
        patch.enabled = false;
        pool.reconfigure(patch);
        CHECK_FALSE(pool.available());
        CHECK(pool.acquire(10ms).error() == StreamErrc::resource_exhausted);
    }
}
