// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nzbstream/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nzbstream::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    info,
    cat,
    warm,
    cache_stats,
    cache_clear,
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> positional;    // NZB source or mount id
    std::string config_path;
    std::string output_file;
    std::string range;                      // "0-1023", "-500" or a full Range header
    std::optional<std::uint32_t> file_index;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                      // Set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Install the stderr logger; -V raises to debug, -q lowers to warn
void setup_logging(bool verbose, bool quiet) noexcept;

// Turn a -r argument into a Range header value
[[nodiscard]] std::string to_range_header(std::string_view range);

// Print files and streamability of an NZB
[[nodiscard]] CliResult info(const std::string& source) noexcept;

// Stream one file (or a byte range of it) to a file or stdout
[[nodiscard]] CliResult cat(const CliArgs& args) noexcept;

// Warm the persistent cache with the critical segments of the best file
[[nodiscard]] CliResult warm(const CliArgs& args) noexcept;

[[nodiscard]] CliResult cache_stats(const CliArgs& args) noexcept;
[[nodiscard]] CliResult cache_clear(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace nzbstream::cli
