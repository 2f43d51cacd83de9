// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nzbstream::yenc {

// =ybegin line
struct YencHeader {
    std::uint32_t line{0};                  // Encoded line length
    std::uint64_t size{0};                  // Size of the whole file
    std::optional<std::uint32_t> part;      // Present for multi-part posts
    std::optional<std::uint32_t> total;
    std::string name;
};

// =ypart line, 1-based inclusive offsets into the whole file
struct YencPart {
    std::uint64_t begin{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const noexcept {
        return end >= begin ? end - begin + 1 : 0;
    }
};

// =yend line
struct YencTrailer {
    std::optional<std::uint64_t> size;
    std::optional<std::uint32_t> part;
    std::optional<std::uint32_t> pcrc32;
    std::optional<std::uint32_t> crc32;
};

struct DecodedArticle {
    std::vector<std::byte> data;
    YencHeader header;
    std::optional<YencPart> part;
    YencTrailer trailer;
    std::uint32_t crc32{0};                 // CRC32 of data
};

// Decode one article body. Lines are the dot-unstuffed body lines without
// line terminators; text before =ybegin is skipped.
[[nodiscard]] std::expected<DecodedArticle, std::error_code>
decode(std::span<const std::string> lines) noexcept;

// CRC32 (IEEE 802.3) of a byte range
[[nodiscard]] std::uint32_t crc32(std::span<const std::byte> data) noexcept;

// Parse a hex CRC; values wider than 32 bits keep the low 32 bits
[[nodiscard]] std::optional<std::uint32_t> parse_crc32(std::string_view hex) noexcept;

} // namespace nzbstream::yenc
