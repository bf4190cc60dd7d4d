// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/commands.hpp>
#include <volley/core/connection_pool.hpp>
#include <volley/version.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace volley::cli;

// Terminate handler to catch exceptions in noexcept functions
static void volley_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

// Log lines go to stderr so stdout stays for the status view and report
static void setup_logging(bool verbose, bool quiet) {
    auto logger = spdlog::stderr_color_mt("volley");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

int main(int argc, char* argv[]) {
    std::set_terminate(volley_terminate_handler);
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
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    setup_logging(args.verbose, args.quiet);

    auto settings = resolve_settings(args);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    // Need at least one source
    if (settings->sources.empty()) {
        std::cerr << "Error: No source specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    volley::core::ConnectionPool::global_init();

    CliResult result = args.info_only
        ? info(*settings)
        : download(*settings, args.verbose, args.quiet);

    volley::core::ConnectionPool::global_cleanup();

    if (!result) {
        return 1;
    }
    return *result;
}
