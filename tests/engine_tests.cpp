// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/engine.hpp>
#include "test_support.hpp"

using namespace nzbstream;
using namespace nzbstream::core;
using namespace nzbstream::stream;

namespace {

struct Release {
    test::FakeFile movie;
    nzb::ParsedNzb parsed;
    std::shared_ptr<test::ScriptedProvider> provider;
};

Release make_release() {
    Release r;
    r.movie = test::make_fake_file("movie.mkv", {300, 300, 300, 300, 300, 100});
    r.parsed = nzb::make_parsed_nzb({r.movie.file});
    r.provider = std::make_shared<test::ScriptedProvider>();

    std::size_t offset = 0;
    for (const auto& seg : r.movie.file.segments) {
        r.provider->add_article(seg.message_id,
                                std::span<const std::byte>(r.movie.content.data() + offset, seg.bytes));
        offset += seg.bytes;
    }
    return r;
}

EngineConfig engine_config(bool with_cache) {
    EngineConfig config;
    config.providers.push_back(test::make_provider("news"));
    config.worker_threads = 2;
    if (with_cache) config.cache_db_path = ":memory:";
    return config;
}

} // namespace

TEST_CASE("Engine end to end", "[engine]") {
    auto release = make_release();
    auto engine = Engine::create(engine_config(true), test::scripted_factory({{"news", release.provider}}));
    REQUIRE(engine);
    auto& e = **engine;

    CHECK(e.cache() != nullptr);
    CHECK(e.manager().is_ready());

    auto id = e.mount(release.parsed, "Movie");
    CHECK(id == release.parsed.hash.substr(0, 16));
    CHECK(e.mounts().size() == 1);
    CHECK(e.service().status().cached_nzbs == 1);

    SECTION("Stream through real decoding") {
        auto created = e.service().create_stream(id, 0, "bytes=250-1349");
        REQUIRE(created);

        std::vector<std::byte> data;
        while (true) {
            auto chunk = created->stream->next_chunk();
            REQUIRE(chunk);
            if (chunk->status == ChunkStatus::end) break;
            auto bytes = chunk->bytes();
            data.insert(data.end(), bytes.begin(), bytes.end());
        }
        CHECK(data == std::vector<std::byte>(release.movie.content.begin() + 250,
                                             release.movie.content.begin() + 1350));

        // Fetched segments were written through to the persistent cache
        CHECK(e.cache()->is_segment_cached(id, 0, 1));
    }

    SECTION("Warm-up") {
        auto warmed = e.warm(id, 0);
        REQUIRE(warmed);
        CHECK(warmed->segments == std::vector<std::uint32_t>{0, 5, 4, 3});
        CHECK(warmed->succeeded == 4);
        CHECK(e.cache()->stats().total_segments == 4);

        auto head = e.cache()->get_cached_segment(id, 0, 0);
        REQUIRE(head);
        CHECK(std::equal(head->begin(), head->end(), release.movie.content.begin()));

        auto again = e.warm(id, 0);
        REQUIRE(again);
        CHECK(again->succeeded == 4);
        CHECK(release.provider->body_calls == 4);
    }

    SECTION("Warm-up errors") {
        CHECK(e.warm("ffffffffffffffff", 0).error() == StreamErrc::mount_not_found);
        CHECK(e.warm(id, 3).error() == StreamErrc::file_not_found);

        ProviderConfigPatch off;
        off.enabled = false;
        REQUIRE_FALSE(e.manager().update_provider("news", off));
        CHECK(e.warm(id, 0).error() == StreamErrc::no_providers);
    }

    SECTION("Shutdown is idempotent") {
        e.shutdown();
        CHECK_FALSE(e.manager().is_ready());
        CHECK(e.service().create_stream(id, 0).error() == StreamErrc::cancelled);
        e.shutdown();
    }

    SECTION("Open streams are cancelled by shutdown") {
        auto created = e.service().create_stream(id, 0, "bytes=400-");
        REQUIRE(created);
        e.shutdown();

        auto chunk = created->stream->poll_next_chunk();
        REQUIRE_FALSE(chunk);
        CHECK(chunk.error() == StreamErrc::cancelled);
        CHECK(created->stream->ended());

        auto after = created->stream->next_chunk();
        REQUIRE(after);
        CHECK(after->status == ChunkStatus::end);
    }

    SECTION("A stream mid-read ends after shutdown") {
        auto created = e.service().create_stream(id, 0);
        REQUIRE(created);
        auto first = created->stream->next_chunk();
        REQUIRE(first);
        REQUIRE(first->status == ChunkStatus::data);
        e.shutdown();

        // Read-ahead already in memory may still drain; the stream must not block
        bool stopped = false;
        for (int i = 0; i < 16 && !stopped; ++i) {
            auto chunk = created->stream->next_chunk();
            if (!chunk) {
                CHECK(chunk.error() == StreamErrc::cancelled);
                stopped = true;
            } else if (chunk->status == ChunkStatus::end) {
                stopped = true;
            } else {
                CHECK(chunk->status == ChunkStatus::data);
            }
        }
        CHECK(stopped);
    }
}

TEST_CASE("Engine without a persistent cache", "[engine]") {
    auto release = make_release();
    auto engine = Engine::create(engine_config(false), test::scripted_factory({{"news", release.provider}}));
    REQUIRE(engine);

    CHECK((*engine)->cache() == nullptr);
    auto id = (*engine)->mount(release.parsed, "Movie");
    CHECK((*engine)->warm(id, 0).error() == StreamErrc::config_error);

    auto created = (*engine)->service().create_stream(id, 0);
    REQUIRE(created);
    CHECK(created->content_length == 1600);
}

TEST_CASE("Engine creation failures", "[engine]") {
    auto config = engine_config(false);
    config.cache_db_path = "/nonexistent-dir/for/sure/cache.db";
    auto engine = Engine::create(config, test::scripted_factory({}));
    REQUIRE_FALSE(engine);
    CHECK(engine.error() == StreamErrc::cache_error);
}
