// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/stream/seekable_stream.hpp>

using namespace nzbstream::core;
using namespace nzbstream::stream;

namespace {

ByteRange require_range(std::string_view header, std::uint64_t total) {
    auto parsed = parse_range_header(header, total);
    REQUIRE(parsed);
    REQUIRE(parsed->has_value());
    return **parsed;
}

} // namespace

TEST_CASE("Range header parsing", "[range]") {
    constexpr std::uint64_t TOTAL = 1000;

    SECTION("Closed range") {
        auto r = require_range("bytes=0-99", TOTAL);
        CHECK(r.start == 0);
        CHECK(r.end == 99);
    }

    SECTION("Open-ended range") {
        auto r = require_range("bytes=500-", TOTAL);
        CHECK(r.start == 500);
        CHECK(r.end == -1);
    }

    SECTION("Suffix range") {
        auto r = require_range("bytes=-100", TOTAL);
        CHECK(r.start == 900);
        CHECK(r.end == 999);
    }

    SECTION("Suffix longer than the file") {
        auto r = require_range("bytes=-5000", TOTAL);
        CHECK(r.start == 0);
        CHECK(r.end == 999);
    }

    SECTION("End is clamped") {
        auto r = require_range("bytes=990-2000", TOTAL);
        CHECK(r.start == 990);
        CHECK(r.end == 999);
    }

    SECTION("Single byte") {
        auto r = require_range("bytes=999-999", TOTAL);
        CHECK(r.start == 999);
        CHECK(r.end == 999);
    }

    SECTION("First of several ranges") {
        auto r = require_range("bytes=0-9, 20-29", TOTAL);
        CHECK(r.start == 0);
        CHECK(r.end == 9);
    }

    SECTION("Case and whitespace") {
        auto r = require_range("  Bytes= 10 - 20 ", TOTAL);
        CHECK(r.start == 10);
        CHECK(r.end == 20);
    }
}

TEST_CASE("Range headers without a range", "[range]") {
    auto none = [](std::optional<std::string_view> header) {
        auto parsed = parse_range_header(header, 1000);
        REQUIRE(parsed);
        return !parsed->has_value();
    };

    CHECK(none(std::nullopt));
    CHECK(none(""));
    CHECK(none("items=0-10"));
    CHECK(none("bytes=abc"));
    CHECK(none("bytes=a-b"));
    CHECK(none("bytes=-"));
    CHECK(none("bytes=10-x"));
}

TEST_CASE("Unsatisfiable ranges", "[range]") {
    auto error = [](std::string_view header, std::uint64_t total) {
        auto parsed = parse_range_header(header, total);
        REQUIRE_FALSE(parsed);
        return parsed.error();
    };

    CHECK(error("bytes=1000-", 1000) == StreamErrc::invalid_range);
    CHECK(error("bytes=5000-6000", 1000) == StreamErrc::invalid_range);
    CHECK(error("bytes=50-10", 1000) == StreamErrc::invalid_range);
    CHECK(error("bytes=-0", 1000) == StreamErrc::invalid_range);
    CHECK(error("bytes=-10", 0) == StreamErrc::invalid_range);
    CHECK(error("bytes=0-", 0) == StreamErrc::invalid_range);
    CHECK(error_kind(error("bytes=1000-", 1000)) == ErrorKind::range);
}
