// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/catalog.hpp>
#include <parcel/core/config.hpp>
#include <parcel/core/lifecycle.hpp>
#include <parcel/core/retry_policy.hpp>
#include <parcel/store/gateway.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace parcel::cli {

// CLI result: process exit code or the error that stopped the command
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string database;      // overrides the configured database
    std::string config_path;
    std::string command;
    std::vector<std::string> operands;

    // list filters
    std::vector<std::int64_t> ids;
    std::vector<std::int64_t> batches;
    std::vector<std::string> extras;
    std::string statuses;      // comma separated status names
    bool only_visible{false};
    std::string order_column;
    std::string order_direction;

    // submit options
    bool hidden{false};

    // retry options
    bool no_network{false};
    bool metered{false};

    bool verbose{false};
    bool version{false};
    bool help{false};
    std::string error;         // set when an option could not be parsed
};

// Everything a command needs, wired to one gateway
struct Services {
    explicit Services(store::Gateway& gateway, const core::Config& config)
        : coordinator(gateway)
        , catalog(gateway)
        , retry(config.max_retry_attempts)
        , config(config) {}

    core::DownloadLifecycleCoordinator coordinator;
    core::DownloadCatalog catalog;
    core::RetryPolicy retry;
    const core::Config& config;
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Run args.command against the services
[[nodiscard]] CliResult run(Services& services, const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace parcel::cli
