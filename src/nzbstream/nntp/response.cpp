// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/nntp/response.hpp>
#include <algorithm>
#include <charconv>

namespace nzbstream::nntp {

using core::StreamErrc;
using core::make_error_code;

std::expected<NntpResponse, std::error_code>
parse_status_line(std::string_view line) noexcept {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() < 3) {
        return std::unexpected(make_error_code(StreamErrc::protocol_error));
    }

    int value = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + 3, value);
    if (ec != std::errc{} || ptr != line.data() + 3 || value < 100 || value > 599) {
        return std::unexpected(make_error_code(StreamErrc::protocol_error));
    }
    if (line.size() > 3 && line[3] != ' ') {
        return std::unexpected(make_error_code(StreamErrc::protocol_error));
    }

    try {
        NntpResponse response;
        response.code = value;
        if (line.size() > 4) response.message = std::string(line.substr(4));
        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
}

std::error_code classify_body_response(const NntpResponse& response) noexcept {
    switch (response.code) {
        case code::BODY_FOLLOWS:
            return {};
        case code::NO_ARTICLE_SELECTED:
        case code::NO_SUCH_ARTICLE_NUMBER:
        case code::NO_SUCH_ARTICLE:
            return make_error_code(StreamErrc::article_not_found);
        case code::AUTH_REQUIRED:
        case code::AUTH_REJECTED:
        case code::AUTH_OUT_OF_SEQUENCE:
        case code::PERMISSION_DENIED:
            return make_error_code(StreamErrc::auth_failed);
        case code::SERVICE_UNAVAILABLE:
            return make_error_code(StreamErrc::connection_closed);
        default:
            break;
    }

    // Other 41x/42x/43x replies are article-level misses on some servers
    if (response.code >= 410 && response.code < 440) {
        return make_error_code(StreamErrc::article_not_found);
    }
    return make_error_code(StreamErrc::protocol_error);
}

std::error_code classify_group_response(const NntpResponse& response) noexcept {
    switch (response.code) {
        case code::GROUP_SELECTED:
            return {};
        case code::NO_SUCH_GROUP:
            return make_error_code(StreamErrc::article_not_found);
        case code::AUTH_REQUIRED:
        case code::AUTH_REJECTED:
        case code::PERMISSION_DENIED:
            return make_error_code(StreamErrc::auth_failed);
        case code::SERVICE_UNAVAILABLE:
            return make_error_code(StreamErrc::connection_closed);
        default:
            return make_error_code(StreamErrc::protocol_error);
    }
}

std::optional<std::size_t>
find_multiline_terminator(std::string_view data, std::size_t body_start,
                          std::size_t search_from) noexcept {
    if (body_start > data.size()) return std::nullopt;

    // Empty block: terminator is the first line
    if (data.substr(body_start).starts_with(".\r\n")) {
        return body_start;
    }

    constexpr std::string_view TERMINATOR = "\r\n.\r\n";
    std::size_t from = std::max(search_from, body_start);
    auto pos = data.find(TERMINATOR, from);
    if (pos == std::string_view::npos) return std::nullopt;
    return pos + 2;
}

std::vector<std::string> split_body_lines(std::string_view body) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < body.size()) {
        auto end = body.find("\r\n", pos);
        std::string_view line = end == std::string_view::npos
            ? body.substr(pos)
            : body.substr(pos, end - pos);

        // Dot-stuffing: a leading ".." stands for "."
        if (line.starts_with("..")) line.remove_prefix(1);
        lines.emplace_back(line);

        if (end == std::string_view::npos) break;
        pos = end + 2;
    }
    return lines;
}

} // namespace nzbstream::nntp
