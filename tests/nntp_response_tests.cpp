// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <nzbstream/nntp/response.hpp>

using namespace nzbstream::core;
using namespace nzbstream::nntp;

TEST_CASE("NNTP status lines", "[nntp]") {
    SECTION("Code and message") {
        auto r = parse_status_line("222 0 <abc@x> body follows\r\n");
        REQUIRE(r);
        CHECK(r->code == 222);
        CHECK(r->message == "0 <abc@x> body follows");
        CHECK(r->ok());
    }

    SECTION("Bare code") {
        auto r = parse_status_line("205");
        REQUIRE(r);
        CHECK(r->code == 205);
        CHECK(r->message.empty());
    }

    SECTION("Continuation") {
        auto r = parse_status_line("381 Password required");
        REQUIRE(r);
        CHECK(r->continue_needed());
        CHECK_FALSE(r->ok());
    }

    SECTION("Malformed") {
        CHECK(parse_status_line("").error() == StreamErrc::protocol_error);
        CHECK(parse_status_line("22").error() == StreamErrc::protocol_error);
        CHECK(parse_status_line("abc hello").error() == StreamErrc::protocol_error);
        CHECK(parse_status_line("2222 too long").error() == StreamErrc::protocol_error);
        CHECK(parse_status_line("099 low").error() == StreamErrc::protocol_error);
    }
}

TEST_CASE("BODY reply classification", "[nntp]") {
    auto classify = [](int code) { return classify_body_response(NntpResponse{code, {}}); };

    CHECK_FALSE(classify(222));
    CHECK(classify(430) == StreamErrc::article_not_found);
    CHECK(classify(423) == StreamErrc::article_not_found);
    CHECK(classify(420) == StreamErrc::article_not_found);
    CHECK(classify(412) == StreamErrc::article_not_found);
    CHECK(classify(480) == StreamErrc::auth_failed);
    CHECK(classify(502) == StreamErrc::auth_failed);
    CHECK(classify(400) == StreamErrc::connection_closed);
    CHECK(classify(500) == StreamErrc::protocol_error);
    CHECK(classify(220) == StreamErrc::protocol_error);
}

TEST_CASE("GROUP reply classification", "[nntp]") {
    auto classify = [](int code) { return classify_group_response(NntpResponse{code, {}}); };

    CHECK_FALSE(classify(211));
    CHECK(classify(411) == StreamErrc::article_not_found);
    CHECK(classify(481) == StreamErrc::auth_failed);
    CHECK(classify(400) == StreamErrc::connection_closed);
    CHECK(classify(999) == StreamErrc::protocol_error);
}

TEST_CASE("Multi-line block terminator", "[nntp]") {
    const std::string status = "222 body\r\n";
    const auto body_start = status.size();

    SECTION("Complete block") {
        std::string data = status + "line one\r\nline two\r\n.\r\n";
        auto pos = find_multiline_terminator(data, body_start);
        REQUIRE(pos);
        CHECK(data.substr(*pos) == ".\r\n");
    }

    SECTION("Empty block") {
        std::string data = status + ".\r\n";
        auto pos = find_multiline_terminator(data, body_start);
        REQUIRE(pos);
        CHECK(*pos == body_start);
    }

    SECTION("Not yet received") {
        std::string data = status + "line one\r\nline tw";
        CHECK_FALSE(find_multiline_terminator(data, body_start));
    }

    SECTION("Dot-stuffed line is not a terminator") {
        std::string data = status + "..not the end\r\nmore\r\n";
        CHECK_FALSE(find_multiline_terminator(data, body_start));
    }

    SECTION("Resume from a later offset") {
        std::string data = status + "aaaa\r\nbbbb\r\n.\r\n";
        auto pos = find_multiline_terminator(data, body_start, body_start + 4);
        REQUIRE(pos);
        CHECK(data.substr(*pos) == ".\r\n");
    }
}

TEST_CASE("Body line splitting", "[nntp]") {
    SECTION("Dot-stuffing is undone") {
        auto lines = split_body_lines("=ybegin x\r\n..leading dot\r\n.\r\nplain");
        REQUIRE(lines.size() == 4);
        CHECK(lines[0] == "=ybegin x");
        CHECK(lines[1] == ".leading dot");
        CHECK(lines[2] == ".");
        CHECK(lines[3] == "plain");
    }

    SECTION("Empty lines survive") {
        auto lines = split_body_lines("a\r\n\r\nb");
        REQUIRE(lines.size() == 3);
        CHECK(lines[1].empty());
    }

    SECTION("Empty body") {
        CHECK(split_body_lines("").empty());
    }
}
