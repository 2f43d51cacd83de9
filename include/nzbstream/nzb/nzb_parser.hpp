// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace nzbstream::nzb {

// One article of a posted file
struct NzbSegment {
    std::string message_id;                 // Without angle brackets
    std::uint32_t bytes{0};                 // Decoded payload size
    std::uint32_t number{0};                // 1-based part number
};

struct NzbFile {
    std::uint32_t index{0};                 // Position in the document
    std::string name;                       // Extracted from the subject
    std::string subject;
    std::string poster;
    std::int64_t date{0};                   // Posting time, epoch seconds
    std::uint64_t size{0};                  // Sum of segment bytes
    bool is_rar{false};
    std::vector<NzbSegment> segments;       // Ordered by number
    std::vector<std::string> groups;
};

struct ParsedNzb {
    std::string hash;                       // SHA-256 over the sorted message-ID set
    std::vector<NzbFile> files;
    std::vector<NzbFile> media_files;       // Streamable files only (no RAR, no non-media)
    std::uint64_t total_size{0};
    std::vector<std::string> groups;        // Union over all files, sorted
};

// Parse an NZB document
[[nodiscard]] std::expected<ParsedNzb, std::error_code>
parse_nzb(std::string_view xml) noexcept;

// Assemble a ParsedNzb from already known files (hash, media split, totals)
[[nodiscard]] ParsedNzb make_parsed_nzb(std::vector<NzbFile> files);

// Hex SHA-256 over the sorted message IDs of all files
[[nodiscard]] std::string nzb_hash(const std::vector<NzbFile>& files);

// No streamable media but at least one RAR volume
[[nodiscard]] bool is_rar_only(const ParsedNzb& nzb) noexcept;

// Largest media file, or nullptr
[[nodiscard]] const NzbFile* best_streamable_file(const ParsedNzb& nzb) noexcept;

// File by document index, or nullptr
[[nodiscard]] const NzbFile* find_file(const ParsedNzb& nzb, std::uint32_t index) noexcept;

// Filename from a Usenet subject line
[[nodiscard]] std::string extract_filename(std::string_view subject);

// Resolve XML character and predefined entities
[[nodiscard]] std::string decode_entities(std::string_view text);

} // namespace nzbstream::nzb
