// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/cli/commands.hpp>
#include <nzbstream/cli/progress_bar.hpp>
#include <nzbstream/core/config.hpp>
#include <nzbstream/core/error.hpp>
#include <nzbstream/engine.hpp>
#include <nzbstream/nzb/media.hpp>
#include <nzbstream/nzb/nzb_loader.hpp>
#include <nzbstream/nzb/nzb_parser.hpp>
#include <nzbstream/stream/segment_cache.hpp>
#include <nzbstream/version.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

using namespace nzbstream::core;

namespace chrono = std::chrono;

namespace nzbstream::cli {

namespace {

std::unexpected<std::error_code> fail(std::string_view what, std::error_code ec) {
    std::cerr << "Error: " << what << ": " << ec.message() << std::endl;
    return std::unexpected(ec);
}

std::string title_of(std::string_view source) {
    auto name = std::filesystem::path(source).filename().string();
    return name.empty() ? std::string(source) : name;
}

bool starts_with_nocase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::optional<std::uint32_t> parse_index(const char* text) {
    char* end = nullptr;
    const unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || end == nullptr || *end != '\0' || value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

std::expected<EngineConfig, std::error_code> config_for(const CliArgs& args) {
    if (args.config_path.empty()) {
        return fail("No configuration file given (use -c)", make_error_code(StreamErrc::config_error));
    }
    auto config = load_config(args.config_path);
    if (!config) {
        return fail("Cannot load " + args.config_path, config.error());
    }
    return config;
}

// Load the NZB and register it with a fresh engine
struct MountedNzb {
    std::unique_ptr<Engine> engine;
    nzb::ParsedNzb parsed;
    std::string mount_id;
};

std::expected<MountedNzb, std::error_code> mount_source(const CliArgs& args) {
    auto config = config_for(args);
    if (!config) {
        return std::unexpected(config.error());
    }

    const auto& source = args.positional.front();
    auto parsed = nzb::load_nzb(source);
    if (!parsed) {
        return fail("Cannot load NZB " + source, parsed.error());
    }

    auto engine = Engine::create(std::move(*config));
    if (!engine) {
        return fail("Cannot start engine", engine.error());
    }

    MountedNzb mounted;
    mounted.engine = std::move(*engine);
    mounted.parsed = std::move(*parsed);
    mounted.mount_id = mounted.engine->mount(mounted.parsed, title_of(source));
    return mounted;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }

        const bool takes_value = arg == "-c" || arg == "--config"
                              || arg == "-o" || arg == "--output"
                              || arg == "-r" || arg == "--range"
                              || arg == "-f" || arg == "--file";
        if (takes_value) {
            if (i + 1 >= argc) {
                args.error = "Missing value for " + arg;
                return args;
            }
            const char* value = argv[++i];
            if (arg == "-c" || arg == "--config") {
                args.config_path = value;
            } else if (arg == "-o" || arg == "--output") {
                args.output_file = value;
            } else if (arg == "-r" || arg == "--range") {
                args.range = value;
            } else {
                args.file_index = parse_index(value);
                if (!args.file_index) {
                    args.error = "Invalid file index: " + std::string(value);
                    return args;
                }
            }
            continue;
        }

        if (arg.size() > 1 && arg.front() == '-') {
            args.error = "Unknown option: " + arg;
            return args;
        }

        if (args.command == Command::none) {
            if (arg == "info") {
                args.command = Command::info;
            } else if (arg == "cat") {
                args.command = Command::cat;
            } else if (arg == "warm") {
                args.command = Command::warm;
            } else if (arg == "cache-stats") {
                args.command = Command::cache_stats;
            } else if (arg == "cache-clear") {
                args.command = Command::cache_clear;
            } else {
                args.error = "Unknown command: " + arg;
                return args;
            }
            continue;
        }

        args.positional.push_back(arg);
    }

    return args;
}

void setup_logging(bool verbose, bool quiet) noexcept {
    try {
        auto logger = spdlog::stderr_color_mt("nzbstream");
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Warning: logger setup failed: " << e.what() << std::endl;
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

std::string to_range_header(std::string_view range) {
    if (range.empty()) return {};
    if (starts_with_nocase(range, "bytes=")) {
        return std::string(range);
    }
    return "bytes=" + std::string(range);
}

//=============================================================================
// Commands
//=============================================================================

CliResult info(const std::string& source) noexcept {
    auto parsed = nzb::load_nzb(source);
    if (!parsed) {
        return fail("Cannot load NZB " + source, parsed.error());
    }
    const auto& release = *parsed;

    std::cout << "NZB:        " << title_of(source) << "\n";
    std::cout << "Hash:       " << release.hash << "\n";
    std::cout << "Mount ID:   " << stream::MemoryMountRepository::mount_id_for(release.hash) << "\n";
    std::cout << "Total size: " << ProgressBar::format_bytes(release.total_size) << "\n";
    std::cout << "Groups:     " << release.groups.size() << "\n";
    std::cout << "\nFiles:\n";

    for (const auto& file : release.files) {
        std::string kind = "other";
        if (nzb::is_media_file(file.name)) {
            kind = std::string(nzb::content_type(file.name));
        } else if (auto archive = nzb::archive_type(file.name); archive != nzb::ArchiveType::none) {
            kind = std::string(nzb::to_string(archive));
        }

        std::cout << "  [" << file.index << "] " << file.name
                  << "  " << ProgressBar::format_bytes(file.size)
                  << "  " << file.segments.size() << " segments"
                  << "  " << kind << "\n";
    }

    std::cout << "\nStreamable: ";
    if (nzb::is_rar_only(release)) {
        std::cout << "no (" << make_error_code(StreamErrc::rar_only).message() << ")\n";
    } else if (const auto* best = nzb::best_streamable_file(release)) {
        std::cout << "yes, file [" << best->index << "] " << best->name
                  << " (" << ProgressBar::format_bytes(best->size) << ")\n";
    } else {
        std::cout << "no (" << make_error_code(StreamErrc::no_media_files).message() << ")\n";
    }
    std::cout << std::flush;

    return 0;
}

CliResult cat(const CliArgs& args) noexcept {
    auto mounted = mount_source(args);
    if (!mounted) {
        return std::unexpected(mounted.error());
    }
    auto& engine = *mounted->engine;

    std::uint32_t index = 0;
    if (args.file_index) {
        index = *args.file_index;
    } else {
        const auto* best = nzb::best_streamable_file(mounted->parsed);
        if (!best) {
            auto check = engine.service().check_streamability(mounted->mount_id);
            std::cerr << "Error: " << check.message << std::endl;
            return std::unexpected(check.error);
        }
        index = best->index;
    }

    std::optional<std::string> header;
    if (!args.range.empty()) {
        header = to_range_header(args.range);
    }

    auto created = engine.service().create_stream(
        mounted->mount_id, index,
        header ? std::optional<std::string_view>(*header) : std::nullopt);
    if (!created) {
        std::cerr << "Error: Cannot open stream: " << created.error().message()
                  << " (HTTP " << http_status(created.error()) << ")" << std::endl;
        return std::unexpected(created.error());
    }

    std::ofstream file;
    std::ostream* out = &std::cout;
    if (!args.output_file.empty()) {
        file.open(args.output_file, std::ios::binary | std::ios::trunc);
        if (!file) {
            return fail("Cannot open " + args.output_file, make_error_code(StreamErrc::io_error));
        }
        out = &file;
    }

    spdlog::info("Streaming {} bytes [{}-{}] of {}", created->content_length,
                 created->start_byte, created->end_byte, created->total_size);

    const bool show_progress = !args.quiet && !args.output_file.empty();
    ProgressBar bar(created->content_length, "Streaming");
    const auto start = chrono::steady_clock::now();
    std::uint64_t written = 0;

    auto& stream = *created->stream;
    while (true) {
        auto chunk = stream.next_chunk();
        if (!chunk) {
            if (show_progress) bar.clear();
            return fail("Stream failed", chunk.error());
        }
        if (chunk->status == stream::ChunkStatus::end) {
            break;
        }

        const auto bytes = chunk->bytes();
        out->write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!*out) {
            stream.close();
            if (show_progress) bar.clear();
            return fail("Write failed", make_error_code(StreamErrc::io_error));
        }
        written += bytes.size();

        if (show_progress) {
            const auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);
            const std::uint64_t speed = elapsed.count() > 0
                ? written * 1000 / static_cast<std::uint64_t>(elapsed.count()) : 0;
            bar.update(written, speed);
        }
    }
    out->flush();
    stream.close();

    if (show_progress) {
        bar.finish();
    }
    spdlog::debug("Wrote {} bytes", written);
    return 0;
}

CliResult warm(const CliArgs& args) noexcept {
    auto mounted = mount_source(args);
    if (!mounted) {
        return std::unexpected(mounted.error());
    }
    auto& engine = *mounted->engine;

    if (!engine.cache()) {
        return fail("Persistent cache disabled (set cacheDbPath)", make_error_code(StreamErrc::config_error));
    }

    std::uint32_t index = 0;
    if (args.file_index) {
        index = *args.file_index;
    } else {
        const auto* best = nzb::best_streamable_file(mounted->parsed);
        if (!best) {
            auto check = engine.service().check_streamability(mounted->mount_id);
            std::cerr << "Error: " << check.message << std::endl;
            return std::unexpected(check.error);
        }
        index = best->index;
    }

    auto result = engine.warm(mounted->mount_id, index);
    if (!result) {
        return fail("Warm-up failed", result.error());
    }

    std::cout << "Mount " << mounted->mount_id << ", file [" << index << "]: "
              << result->succeeded << "/" << result->segments.size() << " critical segments cached";
    if (result->failed > 0) {
        std::cout << ", " << result->failed << " failed";
    }
    std::cout << std::endl;

    return result->failed == 0 ? 0 : 2;
}

CliResult cache_stats(const CliArgs& args) noexcept {
    auto config = config_for(args);
    if (!config) {
        return std::unexpected(config.error());
    }
    if (config->cache_db_path.empty()) {
        return fail("Persistent cache disabled (set cacheDbPath)", make_error_code(StreamErrc::config_error));
    }

    auto cache = stream::SegmentCacheService::open(config->cache_db_path);
    if (!cache) {
        return fail("Cannot open " + config->cache_db_path, cache.error());
    }

    const auto stats = (*cache)->stats();
    std::cout << "Cache:    " << config->cache_db_path << "\n"
              << "Segments: " << stats.total_segments << "\n"
              << "Size:     " << ProgressBar::format_bytes(stats.total_size_bytes) << "\n"
              << "Mounts:   " << stats.mount_count << std::endl;
    return 0;
}

CliResult cache_clear(const CliArgs& args) noexcept {
    auto config = config_for(args);
    if (!config) {
        return std::unexpected(config.error());
    }
    if (config->cache_db_path.empty()) {
        return fail("Persistent cache disabled (set cacheDbPath)", make_error_code(StreamErrc::config_error));
    }

    auto cache = stream::SegmentCacheService::open(config->cache_db_path);
    if (!cache) {
        return fail("Cannot open " + config->cache_db_path, cache.error());
    }

    const auto& mount_id = args.positional.front();
    auto removed = (*cache)->clear_mount_cache(mount_id);
    if (!removed) {
        return fail("Cannot clear " + mount_id, removed.error());
    }

    std::cout << "Removed " << *removed << " cached segments for mount " << mount_id << std::endl;
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "nzbstream " << version.to_string() << " - Usenet media streaming engine\n\n";
    std::cout << "USAGE:\n";
    std::cout << "    " << program_name << " <command> [options]\n\n";
    std::cout << "COMMANDS:\n";
    std::cout << "    info <nzb>               Show files and streamability\n";
    std::cout << "    cat <nzb>                Stream a file to stdout or -o\n";
    std::cout << "    warm <nzb>               Cache first and last segments of the best file\n";
    std::cout << "    cache-stats              Show persistent cache usage\n";
    std::cout << "    cache-clear <mount-id>   Drop cached segments of a mount\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "    -c, --config <file>      JSON configuration (providers, cache)\n";
    std::cout << "    -f, --file <index>       File index inside the NZB (default: largest media file)\n";
    std::cout << "    -r, --range <range>      Byte range, e.g. 0-1048575, 1000- or -4096\n";
    std::cout << "    -o, --output <file>      Output file (default: stdout)\n";
    std::cout << "    -V, --verbose            Debug logging\n";
    std::cout << "    -q, --quiet              Warnings and errors only\n";
    std::cout << "    -h, --help               Show this help\n";
    std::cout << "    -v, --version            Show version\n\n";
    std::cout << "<nzb> is a local path or an http(s) URL.\n\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "    " << program_name << " info movie.nzb\n";
    std::cout << "    " << program_name << " cat movie.nzb -c providers.json -r 0-1048575 -o head.bin\n";
    std::cout << "    " << program_name << " cat https://indexer.example/get/1234.nzb -c providers.json | mpv -\n\n";
    std::cout << "Created by changcheng967\n";
}

void print_version() noexcept {
    std::cout << "nzbstream version " << version.to_string() << "\n";
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << "\n";
    std::cout << "Built with C++23, Boost.Asio, OpenSSL, libcurl, SQLite\n";
}

} // namespace nzbstream::cli
