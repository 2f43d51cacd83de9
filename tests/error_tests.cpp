// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/core/error.hpp>

using namespace nzbstream::core;

TEST_CASE("StreamErrc messages", "[error]") {
    SECTION("Codes carry the nzbstream category") {
        auto ec = make_error_code(StreamErrc::rar_only);
        CHECK(ec.category() == stream_errc_category());
        CHECK(std::string(ec.category().name()) == "nzbstream");
        CHECK_FALSE(ec.message().empty());
    }

    SECTION("Enum compares against error codes") {
        std::error_code ec = StreamErrc::invalid_range;
        CHECK(ec == StreamErrc::invalid_range);
        CHECK(ec != StreamErrc::rar_only);
    }

    SECTION("Success is not an error") {
        std::error_code ec = StreamErrc::success;
        CHECK_FALSE(ec);
    }
}

TEST_CASE("Error classification", "[error]") {
    SECTION("Protocol errors") {
        CHECK(error_kind(make_error_code(StreamErrc::article_not_found)) == ErrorKind::protocol);
        CHECK(error_kind(make_error_code(StreamErrc::timeout)) == ErrorKind::protocol);
        CHECK(error_kind(make_error_code(StreamErrc::auth_failed)) == ErrorKind::protocol);
    }

    SECTION("Decode errors") {
        CHECK(error_kind(make_error_code(StreamErrc::yenc_crc_mismatch)) == ErrorKind::decode);
        CHECK(error_kind(make_error_code(StreamErrc::yenc_missing_header)) == ErrorKind::decode);
    }

    SECTION("Content and lookup errors") {
        CHECK(error_kind(make_error_code(StreamErrc::rar_only)) == ErrorKind::not_streamable);
        CHECK(error_kind(make_error_code(StreamErrc::invalid_range)) == ErrorKind::range);
        CHECK(error_kind(make_error_code(StreamErrc::mount_not_found)) == ErrorKind::lookup);
        CHECK(error_kind(make_error_code(StreamErrc::mount_downloading)) == ErrorKind::state);
        CHECK(error_kind(make_error_code(StreamErrc::no_providers)) == ErrorKind::resource_exhausted);
    }

    SECTION("Foreign categories are I/O") {
        auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
        CHECK(error_kind(ec) == ErrorKind::io);
    }

    SECTION("No error") {
        CHECK(error_kind(std::error_code{}) == ErrorKind::none);
    }
}

TEST_CASE("HTTP status mapping", "[error]") {
    CHECK(http_status(make_error_code(StreamErrc::invalid_range)) == 416);
    CHECK(http_status(make_error_code(StreamErrc::mount_not_found)) == 404);
    CHECK(http_status(make_error_code(StreamErrc::file_not_found)) == 404);
    CHECK(http_status(make_error_code(StreamErrc::rar_only)) == 422);
    CHECK(http_status(make_error_code(StreamErrc::invalid_nzb)) == 422);
    CHECK(http_status(make_error_code(StreamErrc::article_not_found)) == 502);
    CHECK(http_status(make_error_code(StreamErrc::resource_exhausted)) == 503);
    CHECK(http_status(make_error_code(StreamErrc::mount_not_ready)) == 409);
    CHECK(http_status(make_error_code(StreamErrc::io_error)) == 500);
}

TEST_CASE("Provider failover eligibility", "[error]") {
    CHECK(is_retryable_on_other_provider(make_error_code(StreamErrc::article_not_found)));
    CHECK(is_retryable_on_other_provider(make_error_code(StreamErrc::connection_failed)));
    CHECK(is_retryable_on_other_provider(make_error_code(StreamErrc::yenc_crc_mismatch)));
    CHECK_FALSE(is_retryable_on_other_provider(make_error_code(StreamErrc::invalid_nzb)));
    CHECK_FALSE(is_retryable_on_other_provider(make_error_code(StreamErrc::invalid_range)));
}
