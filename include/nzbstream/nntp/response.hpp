// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nzbstream::nntp {

// RFC 3977 / 4643 status codes the client acts on
namespace code {
constexpr int POSTING_ALLOWED = 200;
constexpr int POSTING_PROHIBITED = 201;
constexpr int CLOSING = 205;
constexpr int GROUP_SELECTED = 211;
constexpr int BODY_FOLLOWS = 222;
constexpr int AUTH_ACCEPTED = 281;
constexpr int PASSWORD_REQUIRED = 381;
constexpr int SERVICE_UNAVAILABLE = 400;
constexpr int NO_SUCH_GROUP = 411;
constexpr int NO_ARTICLE_SELECTED = 420;
constexpr int NO_SUCH_ARTICLE_NUMBER = 423;
constexpr int NO_SUCH_ARTICLE = 430;
constexpr int AUTH_REQUIRED = 480;
constexpr int AUTH_REJECTED = 481;
constexpr int AUTH_OUT_OF_SEQUENCE = 482;
constexpr int PERMISSION_DENIED = 502;
} // namespace code

struct NntpResponse {
    int code{0};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return code >= 200 && code < 300; }
    [[nodiscard]] bool continue_needed() const noexcept { return code >= 300 && code < 400; }
};

// "222 0 <id> body follows" -> {222, "0 <id> body follows"}
[[nodiscard]] std::expected<NntpResponse, std::error_code>
parse_status_line(std::string_view line) noexcept;

// Map a BODY reply to success or a typed error
[[nodiscard]] std::error_code classify_body_response(const NntpResponse& response) noexcept;

// Map a GROUP reply
[[nodiscard]] std::error_code classify_group_response(const NntpResponse& response) noexcept;

// Offset of the terminating "." line of a multi-line block whose body starts
// at body_start; scanning resumes at search_from. nullopt if not yet received.
[[nodiscard]] std::optional<std::size_t>
find_multiline_terminator(std::string_view data, std::size_t body_start,
                          std::size_t search_from = 0) noexcept;

// Split a received block (without the terminator) into lines, undoing dot-stuffing
[[nodiscard]] std::vector<std::string> split_body_lines(std::string_view body);

} // namespace nzbstream::nntp
