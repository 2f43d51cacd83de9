// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/stream/seekable_stream.hpp>
#include "test_support.hpp"
#include <fstream>

using namespace nzbstream;
using namespace nzbstream::core;
using namespace nzbstream::stream;

namespace {

// Drain a stream with blocking pulls
std::expected<std::vector<std::byte>, std::error_code> read_all(ByteStream& stream) {
    std::vector<std::byte> out;
    while (true) {
        auto chunk = stream.next_chunk();
        if (!chunk) return std::unexpected(chunk.error());
        if (chunk->status == ChunkStatus::end) return out;
        auto bytes = chunk->bytes();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
}

std::vector<std::byte> expected_slice(const test::FakeFile& fake, std::uint64_t start, std::uint64_t end) {
    return {fake.content.begin() + static_cast<std::ptrdiff_t>(start),
            fake.content.begin() + static_cast<std::ptrdiff_t>(end + 1)};
}

} // namespace

TEST_CASE("SeekableStream reads a whole file", "[stream]") {
    auto fake = test::make_fake_file("movie.mkv", {700, 700, 700, 300});
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(4);

    SeekableStreamOptions options;
    options.file = fake.file;
    auto stream = SeekableStream::create(source, pool, options);
    REQUIRE(stream);

    CHECK((*stream)->start_byte() == 0);
    CHECK((*stream)->end_byte() == 2399);
    CHECK((*stream)->content_length() == 2400);
    CHECK((*stream)->total_size() == 2400);
    CHECK((*stream)->file().name == "movie.mkv");

    auto data = read_all(**stream);
    REQUIRE(data);
    CHECK(*data == fake.content);
    CHECK((*stream)->ended());
    CHECK((*stream)->stats().bytes_streamed == 2400);

    SECTION("Pulls after the end keep returning end") {
        auto chunk = (*stream)->next_chunk();
        REQUIRE(chunk);
        CHECK(chunk->status == ChunkStatus::end);
    }
}

TEST_CASE("SeekableStream byte ranges", "[stream]") {
    auto fake = test::make_fake_file("movie.mkv", {500, 500, 500, 500});
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(4);

    auto open = [&](std::uint64_t start, std::int64_t end) {
        SeekableStreamOptions options;
        options.file = fake.file;
        options.range = ByteRange{start, end};
        return SeekableStream::create(source, pool, options);
    };

    SECTION("Within one segment") {
        auto stream = open(100, 199);
        REQUIRE(stream);
        CHECK((*stream)->content_length() == 100);
        auto data = read_all(**stream);
        REQUIRE(data);
        CHECK(*data == expected_slice(fake, 100, 199));
    }

    SECTION("Across segment boundaries") {
        auto stream = open(550, 1549);
        REQUIRE(stream);
        auto data = read_all(**stream);
        REQUIRE(data);
        CHECK(*data == expected_slice(fake, 550, 1549));
        // Segment 0 is never needed
        CHECK(source.calls_for(fake.file.segments[0].message_id) == 0);
    }

    SECTION("Open-ended") {
        auto stream = open(1999, -1);
        REQUIRE(stream);
        CHECK((*stream)->content_length() == 1);
        auto data = read_all(**stream);
        REQUIRE(data);
        CHECK(*data == expected_slice(fake, 1999, 1999));
    }

    SECTION("End is clamped to the file") {
        auto stream = open(1500, 99'999);
        REQUIRE(stream);
        CHECK((*stream)->end_byte() == 1999);
    }

    SECTION("Unsatisfiable") {
        CHECK(open(2000, -1).error() == StreamErrc::invalid_range);
        CHECK(open(300, 200).error() == StreamErrc::invalid_range);
    }
}

TEST_CASE("SeekableStream over a three-segment release", "[stream]") {
    auto fake = test::make_fake_file("movie.mkv", {1000, 1000, 500});
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(2);

    SeekableStreamOptions options;
    options.file = fake.file;
    auto range = parse_range_header("bytes=1500-1999", 2500);
    REQUIRE(range);
    options.range = *range;
    auto stream = SeekableStream::create(source, pool, options);
    REQUIRE(stream);
    CHECK((*stream)->content_length() == 500);

    // The whole range is the second half of segment 1
    auto chunk = (*stream)->next_chunk();
    REQUIRE(chunk);
    REQUIRE(chunk->status == ChunkStatus::data);
    REQUIRE(chunk->owner);
    CHECK(chunk->owner->size() == 1000);
    CHECK(chunk->offset == 500);
    CHECK(chunk->length == 500);
    auto bytes = chunk->bytes();
    CHECK(std::vector<std::byte>(bytes.begin(), bytes.end()) == expected_slice(fake, 1500, 1999));

    auto last = (*stream)->next_chunk();
    REQUIRE(last);
    CHECK(last->status == ChunkStatus::end);
    CHECK(source.calls_for(fake.file.segments[0].message_id) == 0);
    CHECK(source.calls_for(fake.file.segments[1].message_id) == 1);
}

TEST_CASE("SeekableStream Range headers on a single segment", "[stream]") {
    auto fake = test::make_fake_file("clip.mp4", {1000});
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(2);

    auto open = [&](std::string_view header) {
        SeekableStreamOptions options;
        options.file = fake.file;
        auto range = parse_range_header(header, 1000);
        REQUIRE(range);
        options.range = *range;
        return SeekableStream::create(source, pool, options);
    };

    SECTION("Closed range") {
        auto stream = open("bytes=100-199");
        REQUIRE(stream);
        CHECK((*stream)->start_byte() == 100);
        CHECK((*stream)->end_byte() == 199);
        auto data = read_all(**stream);
        REQUIRE(data);
        CHECK(*data == expected_slice(fake, 100, 199));
    }

    SECTION("Open-ended range") {
        auto stream = open("bytes=900-");
        REQUIRE(stream);
        CHECK((*stream)->content_length() == 100);
        auto data = read_all(**stream);
        REQUIRE(data);
        CHECK(*data == expected_slice(fake, 900, 999));
    }
}

TEST_CASE("SeekableStream polling", "[stream]") {
    auto fake = test::make_fake_file("movie.mkv", {100, 100});
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(2);

    SeekableStreamOptions options;
    options.file = fake.file;
    auto stream = SeekableStream::create(source, pool, options);
    REQUIRE(stream);

    source.close_gate();
    auto first = (*stream)->poll_next_chunk();
    REQUIRE(first);
    CHECK(first->status == ChunkStatus::pending);
    CHECK(first->bytes().empty());
    source.open_gate();

    auto data = read_all(**stream);
    REQUIRE(data);
    CHECK(*data == fake.content);
}

TEST_CASE("SeekableStream seeking", "[stream]") {
    auto fake = test::make_fake_file("movie.mkv", std::vector<std::uint32_t>(10, 100));
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(4);

    SeekableStreamOptions options;
    options.file = fake.file;
    auto created = SeekableStream::create(source, pool, options);
    REQUIRE(created);
    auto& stream = **created;

    auto chunk = stream.next_chunk();
    REQUIRE(chunk);
    REQUIRE(chunk->status == ChunkStatus::data);

    SECTION("Continues from the new offset") {
        REQUIRE_FALSE(stream.seek(750));
        auto data = read_all(stream);
        REQUIRE(data);
        CHECK(*data == expected_slice(fake, 750, 999));
    }

    SECTION("Backwards") {
        REQUIRE_FALSE(stream.seek(50));
        auto next = stream.next_chunk();
        REQUIRE(next);
        CHECK(next->length == 50);
        auto bytes = next->bytes();
        CHECK(std::equal(bytes.begin(), bytes.end(), fake.content.begin() + 50));
    }

    SECTION("Outside the range") {
        CHECK(stream.seek(1000) == StreamErrc::invalid_range);
    }

    SECTION("After close") {
        stream.close();
        CHECK(stream.ended());
        CHECK(stream.seek(10) == StreamErrc::cancelled);
    }
}

TEST_CASE("SeekableStream failures and lifecycle", "[stream]") {
    auto fake = test::make_fake_file("movie.mkv", {100, 100, 100});
    test::FakeArticleSource source;
    source.add_file(fake);
    boost::asio::thread_pool pool(2);

    SeekableStreamOptions options;
    options.file = fake.file;

    SECTION("Empty file") {
        SeekableStreamOptions empty;
        empty.file.name = "empty.mkv";
        CHECK(SeekableStream::create(source, pool, empty).error() == StreamErrc::segment_not_found);
    }

    SECTION("Missing article ends the stream with an error") {
        source.fail(fake.file.segments[1].message_id, make_error_code(StreamErrc::article_not_found));
        auto stream = SeekableStream::create(source, pool, options);
        REQUIRE(stream);

        auto first = (*stream)->next_chunk();
        REQUIRE(first);
        CHECK(first->length == 100);

        auto second = (*stream)->next_chunk();
        REQUIRE_FALSE(second);
        CHECK(second.error() == StreamErrc::article_not_found);
        CHECK((*stream)->ended());
    }

    SECTION("Close hook runs once") {
        int closed = 0;
        auto stream = SeekableStream::create(source, pool, options);
        REQUIRE(stream);
        (*stream)->on_closed([&] { ++closed; });
        REQUIRE(read_all(**stream));
        CHECK(closed == 1);
        (*stream)->close();
        stream->reset();
        CHECK(closed == 1);
    }

    SECTION("Destruction runs the close hook") {
        int closed = 0;
        {
            auto stream = SeekableStream::create(source, pool, options);
            REQUIRE(stream);
            (*stream)->on_closed([&] { ++closed; });
        }
        CHECK(closed == 1);
    }

    SECTION("Progress reporting") {
        std::vector<std::uint64_t> seen;
        options.on_progress = [&](std::uint64_t streamed, std::uint64_t total) {
            seen.push_back(streamed);
            CHECK(total == 300);
        };
        auto stream = SeekableStream::create(source, pool, options);
        REQUIRE(stream);
        REQUIRE(read_all(**stream));
        CHECK(seen == std::vector<std::uint64_t>{100, 200, 300});
    }

    SECTION("Pause and resume") {
        auto stream = SeekableStream::create(source, pool, options);
        REQUIRE(stream);
        (*stream)->pause();
        CHECK((*stream)->stats().prefetch.paused);
        auto chunk = (*stream)->next_chunk();
        REQUIRE(chunk);
        CHECK(chunk->status == ChunkStatus::data);
        CHECK_FALSE((*stream)->stats().prefetch.paused);
    }
}

TEST_CASE("LocalFileStream", "[stream]") {
    test::TempPath path("nzbstream-local.bin");
    auto content = test::make_bytes(10'000, 4);
    {
        std::ofstream out(path.path(), std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    SECTION("Whole file in chunks") {
        auto stream = LocalFileStream::open(path.path(), std::nullopt, 4096);
        REQUIRE(stream);
        CHECK((*stream)->content_length() == 10'000);

        auto first = (*stream)->next_chunk();
        REQUIRE(first);
        CHECK(first->length == 4096);

        auto rest = read_all(**stream);
        REQUIRE(rest);
        CHECK(rest->size() == 10'000 - 4096);
        CHECK((*stream)->ended());
    }

    SECTION("Range") {
        auto stream = LocalFileStream::open(path.path(), ByteRange{9000, -1});
        REQUIRE(stream);
        CHECK((*stream)->start_byte() == 9000);
        CHECK((*stream)->end_byte() == 9999);
        auto data = read_all(**stream);
        REQUIRE(data);
        CHECK(*data == std::vector<std::byte>(content.begin() + 9000, content.end()));
    }

    SECTION("Errors") {
        CHECK(LocalFileStream::open("/nonexistent/file.mkv", std::nullopt).error() == StreamErrc::file_not_found);
        CHECK(LocalFileStream::open(path.path(), ByteRange{20'000, -1}).error() == StreamErrc::invalid_range);
    }
}
