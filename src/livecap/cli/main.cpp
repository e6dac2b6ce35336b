// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/cli/commands.hpp>
#include <livecap/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace livecap::cli;

// Report the exception that escaped a noexcept function before aborting
static void livecap_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(livecap_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }
    if (args.url.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    auto level = args.verbose ? spdlog::level::debug
               : args.quiet   ? spdlog::level::warn
               : spdlog::level::info;
    livecap::core::init_logging(level);

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: Could not load " << args.config_file->string() << ": "
                  << config.error().message() << std::endl;
        return EXIT_USAGE;
    }

    return run_capture(args.url, *config, args.quiet);
}
