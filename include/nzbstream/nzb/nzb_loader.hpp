// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace nzbstream::nzb {

constexpr std::uint64_t MAX_NZB_DOCUMENT_SIZE = 64ULL * 1024 * 1024;
constexpr long NZB_FETCH_TIMEOUT_SEC = 60;
constexpr long NZB_FETCH_MAX_REDIRECTS = 5;

[[nodiscard]] bool is_url(std::string_view source) noexcept;

// Raw document from a local path or an http(s) URL
[[nodiscard]] std::expected<std::string, std::error_code>
read_nzb_document(std::string_view source) noexcept;

// Read and parse
[[nodiscard]] std::expected<ParsedNzb, std::error_code>
load_nzb(std::string_view source) noexcept;

// libcurl process-wide setup, once at start-up
void global_init() noexcept;
void global_cleanup() noexcept;

} // namespace nzbstream::nzb
