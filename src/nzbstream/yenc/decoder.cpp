// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/yenc/decoder.hpp>
#include <boost/crc.hpp>
#include <algorithm>
#include <charconv>

namespace nzbstream::yenc {

namespace {

using core::StreamErrc;
using core::make_error_code;

// Value of "key=" up to the next space
std::optional<std::string_view> find_field(std::string_view line, std::string_view key) noexcept {
    std::size_t pos = 0;
    while ((pos = line.find(key, pos)) != std::string_view::npos) {
        // Must start a token, so "size=" never matches inside "psize="
        if (pos == 0 || line[pos - 1] == ' ') {
            auto value = line.substr(pos + key.size());
            auto end = value.find(' ');
            return end == std::string_view::npos ? value : value.substr(0, end);
        }
        pos += key.size();
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> extract_int(std::string_view line, std::string_view key) noexcept {
    auto value = find_field(line, key);
    if (!value || value->empty()) return std::nullopt;

    T result{};
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc{}) return std::nullopt;
    return result;
}

void strip_line_end(std::string_view& line) noexcept {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == '\0')) {
        line.remove_suffix(1);
    }
}

YencHeader parse_header(std::string_view line) {
    YencHeader header;
    header.line = extract_int<std::uint32_t>(line, "line=").value_or(0);
    header.size = extract_int<std::uint64_t>(line, "size=").value_or(0);
    header.part = extract_int<std::uint32_t>(line, "part=");
    header.total = extract_int<std::uint32_t>(line, "total=");

    // name= is always last and may contain spaces
    if (auto pos = line.find(" name="); pos != std::string_view::npos) {
        header.name = std::string(line.substr(pos + 6));
    }
    return header;
}

YencPart parse_part(std::string_view line) noexcept {
    YencPart part;
    part.begin = extract_int<std::uint64_t>(line, "begin=").value_or(0);
    part.end = extract_int<std::uint64_t>(line, "end=").value_or(0);
    return part;
}

YencTrailer parse_trailer(std::string_view line) noexcept {
    YencTrailer trailer;
    trailer.size = extract_int<std::uint64_t>(line, "size=");
    trailer.part = extract_int<std::uint32_t>(line, "part=");
    if (auto v = find_field(line, "pcrc32=")) trailer.pcrc32 = parse_crc32(*v);
    if (auto v = find_field(line, "crc32=")) trailer.crc32 = parse_crc32(*v);
    return trailer;
}

bool starts_with_keyword(std::string_view line, std::string_view keyword) noexcept {
    if (!line.starts_with(keyword)) return false;
    return line.size() == keyword.size() || line[keyword.size()] == ' ';
}

} // namespace

//=============================================================================
// Decoder
//=============================================================================

std::optional<std::uint32_t> parse_crc32(std::string_view hex) noexcept {
    while (!hex.empty() && (hex.back() == '\r' || hex.back() == ' ')) {
        hex.remove_suffix(1);
    }
    if (hex.starts_with("0x") || hex.starts_with("0X")) hex.remove_prefix(2);
    if (hex.empty()) return std::nullopt;

    // Low 32 bits are the last eight digits
    if (hex.size() > 8) hex.remove_prefix(hex.size() - 8);

    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) return std::nullopt;
    return value;
}

std::uint32_t crc32(std::span<const std::byte> data) noexcept {
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

std::expected<DecodedArticle, std::error_code>
decode(std::span<const std::string> lines) noexcept {
    try {
        DecodedArticle article;

        std::size_t i = 0;
        for (; i < lines.size(); ++i) {
            if (starts_with_keyword(lines[i], "=ybegin")) break;
        }
        if (i == lines.size()) {
            return std::unexpected(make_error_code(StreamErrc::yenc_missing_header));
        }

        std::string_view begin_line = lines[i];
        strip_line_end(begin_line);
        article.header = parse_header(begin_line);
        ++i;

        if (i < lines.size() && starts_with_keyword(lines[i], "=ypart")) {
            article.part = parse_part(lines[i]);
            ++i;
        }

        std::uint64_t expected_size = article.part ? article.part->size() : article.header.size;
        article.data.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(expected_size, 16 * 1024 * 1024)));

        bool found_end = false;
        bool escaped = false;   // '=' was the last character of the previous line
        for (; i < lines.size(); ++i) {
            std::string_view line = lines[i];

            if (!escaped && starts_with_keyword(line, "=yend")) {
                strip_line_end(line);
                article.trailer = parse_trailer(line);
                found_end = true;
                break;
            }

            for (char ch : line) {
                auto c = static_cast<unsigned char>(ch);
                if (escaped) {
                    article.data.push_back(static_cast<std::byte>((c - 64 - 42) & 0xFF));
                    escaped = false;
                    continue;
                }
                if (c == '=') {
                    escaped = true;
                    continue;
                }
                // Bare line terminators are never data
                if (c == '\r' || c == '\n') continue;
                article.data.push_back(static_cast<std::byte>((c - 42) & 0xFF));
            }
        }

        if (!found_end) {
            return std::unexpected(make_error_code(StreamErrc::yenc_missing_trailer));
        }

        std::uint64_t actual = article.data.size();
        if (article.part && article.part->end < article.part->begin) {
            return std::unexpected(make_error_code(StreamErrc::yenc_size_mismatch));
        }
        if (actual != expected_size) {
            return std::unexpected(make_error_code(StreamErrc::yenc_size_mismatch));
        }
        if (article.trailer.size && *article.trailer.size != actual) {
            return std::unexpected(make_error_code(StreamErrc::yenc_size_mismatch));
        }

        article.crc32 = crc32(article.data);

        // Multi-part posts carry the part CRC in pcrc32; crc32 there covers the whole file
        std::optional<std::uint32_t> expected_crc = article.part
            ? article.trailer.pcrc32
            : (article.trailer.crc32 ? article.trailer.crc32 : article.trailer.pcrc32);
        if (expected_crc && *expected_crc != article.crc32) {
            return std::unexpected(make_error_code(StreamErrc::yenc_crc_mismatch));
        }

        return article;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(StreamErrc::resource_exhausted));
    }
}

} // namespace nzbstream::yenc
