// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/cli/commands.hpp>
#include <parcel/cli/render.hpp>
#include <parcel/core/log.hpp>
#include <parcel/version.hpp>
#include <charconv>
#include <iostream>
#include <functional>

using namespace parcel::core;

namespace parcel::cli {

namespace {

std::optional<std::int64_t> parse_int(std::string_view text) noexcept {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint64_t> parse_bytes(std::string_view text) noexcept {
    auto value = parse_int(text);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*value);
}

std::expected<StatusMask, std::error_code> parse_status_list(std::string_view list) {
    StatusMask mask = 0;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto name = list.substr(0, comma);
        auto status = parse_status(name);
        if (!status) {
            return std::unexpected(status.error());
        }
        mask |= mask_of(*status);
        list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
    }
    return mask;
}

std::expected<FileStatus, std::error_code> parse_file_status(std::string_view name) {
    if (name == "incomplete") return FileStatus::incomplete;
    if (name == "paused") return FileStatus::paused;
    if (name == "success") return FileStatus::success;
    if (name == "failed") return FileStatus::failed;
    return std::unexpected(make_error_code(Errc::invalid_request));
}

CliResult fail(std::string_view what, std::error_code ec) {
    std::cerr << "Error: " << what << ": " << ec.message() << std::endl;
    return std::unexpected(ec);
}

CliResult usage(std::string_view text) {
    std::cerr << "Usage: parcel " << text << std::endl;
    return std::unexpected(make_error_code(Errc::invalid_request));
}

CliResult done(std::error_code ec, std::string_view what) {
    if (ec) {
        return fail(what, ec);
    }
    return 0;
}

// Reads the download id in operand 0
std::optional<DownloadId> id_operand(const CliArgs& args) {
    if (args.operands.empty()) {
        return std::nullopt;
    }
    auto value = parse_int(args.operands[0]);
    if (!value) {
        return std::nullopt;
    }
    return DownloadId(*value);
}

//=============================================================================
// Commands
//=============================================================================

CliResult cmd_submit(Services& s, const CliArgs& args) {
    if (args.operands.empty()) {
        return usage("submit [--batch N] [--extra TAG] [--hidden] URI=LOCAL...");
    }

    DownloadRequest request;
    if (!args.batches.empty()) {
        request.batch_id = args.batches.front();
    }
    if (!args.extras.empty()) {
        request.extra = args.extras.front();
    }
    request.visible = !args.hidden;

    for (const auto& operand : args.operands) {
        auto eq = operand.rfind('=');
        if (eq == std::string::npos) {
            return usage("submit [--batch N] [--extra TAG] [--hidden] URI=LOCAL...");
        }
        request.files.push_back({"", operand.substr(0, eq), operand.substr(eq + 1)});
    }

    auto id = s.coordinator.submit(request);
    if (!id) {
        return fail("submit", id.error());
    }
    std::cout << id->value() << std::endl;
    return 0;
}

CliResult cmd_list(Services& s, const CliArgs& args) {
    Query query;
    if (!args.ids.empty()) {
        std::vector<DownloadId> ids;
        for (auto id : args.ids) {
            ids.emplace_back(id);
        }
        query.filter_by_id(std::move(ids));
    }
    if (!args.batches.empty()) {
        query.filter_by_batch_id(args.batches);
    }
    if (!args.extras.empty()) {
        query.filter_by_extras(args.extras);
    }
    if (!args.statuses.empty()) {
        auto mask = parse_status_list(args.statuses);
        if (!mask) {
            return fail("--status", mask.error());
        }
        query.filter_by_status(*mask);
    }
    query.only_include_visible(args.only_visible || s.config.only_visible);

    const std::string& column = args.order_column.empty() ? s.config.order_column : args.order_column;
    const std::string& direction = args.order_direction.empty() ? s.config.order_direction : args.order_direction;
    if (auto ec = query.order_by(column, direction)) {
        return fail("--order", ec);
    }

    auto downloads = s.catalog.list(query, MalformedPolicy::skip);
    if (!downloads) {
        return fail("list", downloads.error());
    }
    for (const auto& download : *downloads) {
        std::cout << render_download(download, false);
    }
    return 0;
}

CliResult cmd_show(Services& s, const CliArgs& args) {
    auto id = id_operand(args);
    if (!id) {
        return usage("show ID");
    }
    auto download = s.catalog.get(*id);
    if (!download) {
        return fail("show", download.error());
    }
    std::cout << render_download(*download, true);
    return 0;
}

CliResult cmd_simple(const CliArgs& args, std::string_view name,
                     const std::function<std::error_code(DownloadId)>& action) {
    auto id = id_operand(args);
    if (!id) {
        return usage(std::string(name) + " ID");
    }
    return done(action(*id), name);
}

CliResult cmd_remove(Services& s, const CliArgs& args) {
    if (args.operands.empty()) {
        return usage("remove ID...");
    }
    std::vector<DownloadId> ids;
    for (const auto& operand : args.operands) {
        auto value = parse_int(operand);
        if (!value) {
            return usage("remove ID...");
        }
        ids.emplace_back(*value);
    }
    return done(s.coordinator.remove(ids), "remove");
}

CliResult cmd_stage(Services& s, const CliArgs& args) {
    auto id = id_operand(args);
    if (!id || args.operands.size() != 2) {
        return usage("stage ID CODE|NAME");
    }
    auto stage = Stage::parse(args.operands[1]);
    if (!stage) {
        return fail("stage", stage.error());
    }
    return done(s.coordinator.update_download_stage(*id, *stage), "stage");
}

CliResult cmd_file_size(Services& s, const CliArgs& args, bool total) {
    auto id = id_operand(args);
    std::optional<std::uint64_t> bytes;
    if (args.operands.size() == 3) {
        bytes = parse_bytes(args.operands[2]);
    }
    if (!id || !bytes) {
        return usage(total ? "total ID URI BYTES" : "progress ID URI BYTES");
    }

    FileRef file{*id, args.operands[1]};
    auto ec = total ? s.coordinator.record_file_total_size(file, *bytes)
                    : s.coordinator.record_file_progress(file, *bytes);
    return done(ec, total ? "total" : "progress");
}

CliResult cmd_complete(Services& s, const CliArgs& args) {
    auto id = id_operand(args);
    std::optional<std::uint64_t> bytes;
    if (args.operands.size() == 4) {
        bytes = parse_bytes(args.operands[3]);
    }
    if (!id || !bytes) {
        return usage("complete ID URI incomplete|paused|success|failed BYTES");
    }
    auto status = parse_file_status(args.operands[2]);
    if (!status) {
        return fail("complete", status.error());
    }
    return done(s.coordinator.complete_file({*id, args.operands[1]}, *status, *bytes), "complete");
}

CliResult cmd_batch(Services& s, const CliArgs& args) {
    auto batch = args.operands.empty() ? std::nullopt : parse_int(args.operands[0]);
    if (!batch) {
        return usage("batch ID");
    }
    auto status = s.catalog.batch_status(*batch);
    if (!status) {
        return fail("batch", status.error());
    }
    std::cout << to_string(*status) << std::endl;
    return 0;
}

CliResult cmd_retry(Services& s, const CliArgs& args) {
    auto id = id_operand(args);
    std::optional<std::int64_t> attempts;
    if (args.operands.size() == 2) {
        attempts = parse_int(args.operands[1]);
    }
    if (!id || !attempts || *attempts < 0) {
        return usage("retry ID ATTEMPTS [--no-network] [--metered]");
    }

    auto download = s.catalog.get(*id);
    if (!download) {
        return fail("retry", download.error());
    }

    AttemptState attempt{static_cast<std::uint32_t>(*attempts), false};
    Connectivity connectivity{!args.no_network, !args.metered};
    auto decision = s.retry.decide(download->stage, attempt, connectivity);
    std::cout << to_string(decision) << std::endl;
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        auto next_value = [&](int& i, std::string_view option) -> std::string {
            if (i + 1 < argc) {
                return argv[++i];
            }
            args.error = std::string(option) + " needs a value";
            return {};
        };

        auto next_number = [&](int& i, std::string_view option, std::vector<std::int64_t>& out) {
            auto text = next_value(i, option);
            if (auto value = parse_int(text)) {
                out.push_back(*value);
            } else if (args.error.empty()) {
                args.error = std::string(option) + " expects a number";
            }
        };

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
            } else if (arg == "--db") {
                args.database = next_value(i, arg);
            } else if (arg == "-c" || arg == "--config") {
                args.config_path = next_value(i, arg);
            } else if (arg == "--id") {
                next_number(i, arg, args.ids);
            } else if (arg == "--batch") {
                next_number(i, arg, args.batches);
            } else if (arg == "--extra") {
                args.extras.push_back(next_value(i, arg));
            } else if (arg == "--status") {
                args.statuses = next_value(i, arg);
            } else if (arg == "--visible") {
                args.only_visible = true;
            } else if (arg == "--order") {
                args.order_column = next_value(i, arg);
            } else if (arg == "--asc") {
                args.order_direction = "asc";
            } else if (arg == "--desc") {
                args.order_direction = "desc";
            } else if (arg == "--hidden") {
                args.hidden = true;
            } else if (arg == "--no-network") {
                args.no_network = true;
            } else if (arg == "--metered") {
                args.metered = true;
            } else if (arg.starts_with("--")) {
                args.error = "unknown option " + arg;
            } else if (args.command.empty()) {
                args.command = arg;
            } else {
                args.operands.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        args.error = e.what();
    }

    return args;
}

CliResult run(Services& services, const CliArgs& args) {
    const std::string& c = args.command;
    logger()->debug("Running '{}' with {} operand(s)", c, args.operands.size());

    if (c == "submit") return cmd_submit(services, args);
    if (c == "list") return cmd_list(services, args);
    if (c == "show") return cmd_show(services, args);
    if (c == "pause") {
        return cmd_simple(args, c, [&](DownloadId id) { return services.coordinator.pause(id); });
    }
    if (c == "resume") {
        return cmd_simple(args, c, [&](DownloadId id) { return services.coordinator.resume(id); });
    }
    if (c == "requeue") {
        return cmd_simple(args, c, [&](DownloadId id) { return services.coordinator.requeue(id); });
    }
    if (c == "remove") return cmd_remove(services, args);
    if (c == "stage") return cmd_stage(services, args);
    if (c == "progress") return cmd_file_size(services, args, false);
    if (c == "total") return cmd_file_size(services, args, true);
    if (c == "complete") return cmd_complete(services, args);
    if (c == "batch") return cmd_batch(services, args);
    if (c == "retry") return cmd_retry(services, args);

    std::cerr << "Error: unknown command '" << c << "'" << std::endl;
    std::cout << "Use -h for help" << std::endl;
    return std::unexpected(make_error_code(Errc::invalid_request));
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "parcel - persistent download queue\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Log debug output\n";
    std::cout << "  -c, --config <FILE>     JSON configuration file\n";
    std::cout << "      --db <PATH>         Database file (overrides the config)\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  submit [--batch N] [--extra TAG] [--hidden] URI=LOCAL...\n";
    std::cout << "  list [--id N]... [--batch N]... [--extra TAG]... [--status a,b]\n";
    std::cout << "       [--visible] [--order last_modified|total_size] [--asc|--desc]\n";
    std::cout << "  show ID\n";
    std::cout << "  pause ID | resume ID | requeue ID\n";
    std::cout << "  remove ID...\n";
    std::cout << "  stage ID CODE|NAME\n";
    std::cout << "  progress ID URI BYTES\n";
    std::cout << "  total ID URI BYTES\n";
    std::cout << "  complete ID URI incomplete|paused|success|failed BYTES\n";
    std::cout << "  batch ID\n";
    std::cout << "  retry ID ATTEMPTS [--no-network] [--metered]\n";
    std::cout << "\n";
    std::cout << "STATUS NAMES: pending, running, paused, successful, failed\n";
}

void print_version() noexcept {
    std::cout << "parcel " << parcel::version.to_string() << std::endl;
    std::cout << "Database schema " << SCHEMA_VERSION << ", stage codes " << STAGE_CODES_VERSION << "\n";
    std::cout << "Built with C++23, SQLite3, spdlog, nlohmann/json\n";
}

} // namespace parcel::cli
