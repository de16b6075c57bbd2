// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/cli/commands.hpp>
#include <parcel/core/config.hpp>
#include <parcel/core/log.hpp>
#include <parcel/store/sqlite_gateway.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace parcel::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void parcel_terminate_handler() {
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

int main(int argc, char* argv[]) {
    std::set_terminate(parcel_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        return 1;
    }
    if (args.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    parcel::core::Config config;
    if (!args.config_path.empty()) {
        auto loaded = parcel::core::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: " << args.config_path << ": " << loaded.error().message() << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }
    if (!args.database.empty()) {
        config.database = args.database;
    }
    if (args.verbose) {
        config.log.level = spdlog::level::debug;
    }
    parcel::core::init_logging(config.log);

    auto gateway = parcel::store::SqliteGateway::open(config.database);
    if (!gateway) {
        std::cerr << "Error: " << config.database << ": " << gateway.error().message() << std::endl;
        return 1;
    }

    Services services(**gateway, config);
    auto result = run(services, args);
    if (!result) {
        return 1;
    }
    return *result;
}
