// Copyright (c) 2026 changcheng967. All rights reserved.

#include <nzbstream/cli/commands.hpp>
#include <nzbstream/nzb/nzb_loader.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace nzbstream::cli;

// Terminate handler to catch exceptions in noexcept functions
static void nzbstream_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

namespace {

// Positional arguments each command needs
std::size_t required_positionals(Command command) noexcept {
    switch (command) {
        case Command::info:
        case Command::cat:
        case Command::warm:
        case Command::cache_clear:
            return 1;
        default:
            return 0;
    }
}

CliResult dispatch(const CliArgs& args) noexcept {
    switch (args.command) {
        case Command::info:        return info(args.positional.front());
        case Command::cat:         return cat(args);
        case Command::warm:        return warm(args);
        case Command::cache_stats: return cache_stats(args);
        case Command::cache_clear: return cache_clear(args);
        case Command::none:        break;
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(nzbstream_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.command == Command::none) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.positional.size() < required_positionals(args.command)) {
        std::cerr << "Error: Missing argument" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    setup_logging(args.verbose, args.quiet);
    nzbstream::nzb::global_init();

    auto result = dispatch(args);

    nzbstream::nzb::global_cleanup();
    return result ? *result : 1;
}
