// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/lifecycle.hpp>
#include <parcel/core/assembler.hpp>
#include <parcel/core/log.hpp>
#include <parcel/store/schema.hpp>
#include <algorithm>
#include <chrono>
#include <format>
#include <limits>
#include <set>
#include <string>

namespace parcel::core {

namespace col = store::columns;

namespace {

std::pair<std::string, store::Value> field(std::string_view column, store::Value value) {
    return {std::string(column), std::move(value)};
}

// Sizes are stored as signed 64-bit integers
constexpr std::uint64_t MAX_STORED_SIZE = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

std::error_code check_size(const FileRef& file, std::uint64_t bytes) {
    if (bytes > MAX_STORED_SIZE) {
        logger()->warn("Download {}: size {} for {} cannot be stored", file.download.value(), bytes, file.uri);
        return make_error_code(Errc::invalid_request);
    }
    return {};
}

store::Value size_value(std::uint64_t bytes) noexcept {
    return static_cast<std::int64_t>(bytes);
}

store::Selection file_selection(const FileRef& file) {
    return {std::format("{} = ? AND {} = ?", col::FILE_DOWNLOAD_ID, col::FILE_URI),
            {file.download.value(), file.uri}};
}

store::Selection live_download(DownloadId id) {
    return {std::format("{} = ? AND {} != 1", col::ID, col::DELETED), {id.value()}};
}

std::int64_t system_now() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::error_code validate(const DownloadRequest& request) {
    if (request.files.empty()) {
        return make_error_code(Errc::invalid_request);
    }
    std::set<std::string_view> seen;
    for (const auto& file : request.files) {
        if (file.uri.empty() || file.local_uri.empty()) {
            return make_error_code(Errc::invalid_request);
        }
        // The upstream URI identifies a file inside its download
        if (!seen.insert(file.uri).second) {
            return make_error_code(Errc::invalid_request);
        }
    }
    return {};
}

} // namespace

DownloadLifecycleCoordinator::DownloadLifecycleCoordinator(store::Gateway& gateway, Clock clock)
    : gateway_(gateway)
    , clock_(clock ? std::move(clock) : Clock(system_now)) {}

//=============================================================================
// Submission
//=============================================================================

std::expected<DownloadId, std::error_code> DownloadLifecycleCoordinator::create_request() {
    const auto token = std::format("{}-{}",
        std::chrono::steady_clock::now().time_since_epoch().count(),
        request_counter_.fetch_add(1, std::memory_order_relaxed));

    auto id = gateway_.insert(store::RecordKind::request, {field(col::REQUEST_TIMESTAMP, token)});
    if (!id) {
        return std::unexpected(id.error());
    }
    return DownloadId(*id);
}

std::expected<DownloadId, std::error_code> DownloadLifecycleCoordinator::submit(const DownloadRequest& request) {
    if (auto ec = validate(request)) {
        logger()->warn("Rejected download request with {} file(s)", request.files.size());
        return std::unexpected(ec);
    }

    DownloadId id;
    auto ec = gateway_.transaction([&]() -> std::error_code {
        auto created = create_request();
        if (!created) {
            return created.error();
        }
        id = *created;

        store::Fields download{
            field(col::ID, id.value()),
            field(col::BATCH_ID, request.batch_id ? store::Value{*request.batch_id} : store::Value{}),
            field(col::STAGE, static_cast<std::int64_t>(Stage(StageCode::queued).code())),
            field(col::EXTRAS, request.extra ? store::Value{*request.extra} : store::Value{}),
            field(col::VISIBLE, std::int64_t{request.visible ? 1 : 0}),
            field(col::DELETED, std::int64_t{0}),
            field(col::LAST_MODIFIED, clock_()),
        };
        auto row = gateway_.insert(store::RecordKind::download, download);
        if (!row) {
            return row.error();
        }

        std::vector<store::Fields> files;
        files.reserve(request.files.size());
        for (const auto& file : request.files) {
            files.push_back({
                field(col::FILE_DOWNLOAD_ID, id.value()),
                field(col::FILE_IDENTIFIER, file.identifier),
                field(col::FILE_URI, file.uri),
                field(col::FILE_LOCAL_URI, file.local_uri),
                field(col::FILE_CURRENT_SIZE, std::int64_t{0}),
                field(col::FILE_TOTAL_SIZE, std::int64_t{0}),
                field(col::FILE_STATUS, std::string(to_code(FileStatus::incomplete))),
            });
        }
        return gateway_.bulk_insert(store::RecordKind::file, files);
    });

    if (ec) {
        logger()->error("Submitting download failed: {}", ec.message());
        return std::unexpected(ec);
    }
    logger()->info("Download {} queued with {} file(s)", id.value(), request.files.size());
    return id;
}

//=============================================================================
// File updates
//=============================================================================

std::error_code DownloadLifecycleCoordinator::record_file_progress(const FileRef& file, std::uint64_t bytes_written) {
    if (auto ec = check_size(file, bytes_written)) {
        return ec;
    }
    return gateway_.transaction([&]() -> std::error_code {
        if (auto live = current_stage(file.download); !live) {
            return live.error();
        }

        // Conditional write: the store only accepts forward progress within a known total
        store::Selection selection = file_selection(file);
        selection.clause += std::format(" AND {0} <= ? AND ({1} = 0 OR {1} >= ?)",
                                        col::FILE_CURRENT_SIZE, col::FILE_TOTAL_SIZE);
        selection.params.push_back(size_value(bytes_written));
        selection.params.push_back(size_value(bytes_written));

        auto affected = gateway_.update(store::RecordKind::file,
                                        {field(col::FILE_CURRENT_SIZE, size_value(bytes_written))},
                                        selection);
        if (!affected) {
            return affected.error();
        }

        if (*affected == 0) {
            auto state = read_file(file);
            if (!state) {
                return state.error();
            }
            if (state->current_size > bytes_written) {
                logger()->warn("Download {}: progress for {} went back from {} to {}",
                               file.download.value(), file.uri, state->current_size, bytes_written);
                return make_error_code(Errc::progress_regression);
            }
            logger()->warn("Download {}: progress {} for {} exceeds total {}",
                           file.download.value(), bytes_written, file.uri, state->total_size);
            return make_error_code(Errc::size_conflict);
        }

        logger()->trace("Download {}: {} at {} bytes", file.download.value(), file.uri, bytes_written);
        return touch(file.download);
    });
}

std::error_code DownloadLifecycleCoordinator::record_file_total_size(const FileRef& file, std::uint64_t total_bytes) {
    if (auto ec = check_size(file, total_bytes)) {
        return ec;
    }
    return gateway_.transaction([&]() -> std::error_code {
        if (auto live = current_stage(file.download); !live) {
            return live.error();
        }
        auto state = read_file(file);
        if (!state) {
            return state.error();
        }
        if (state->total_size == total_bytes) {
            return {};
        }
        if (state->current_size > total_bytes) {
            logger()->warn("Download {}: total {} for {} is below recorded progress {}",
                           file.download.value(), total_bytes, file.uri, state->current_size);
            return make_error_code(Errc::size_conflict);
        }

        auto affected = gateway_.update(store::RecordKind::file,
                                        {field(col::FILE_TOTAL_SIZE, size_value(total_bytes))},
                                        file_selection(file));
        if (!affected) {
            return affected.error();
        }
        logger()->debug("Download {}: {} is {} bytes", file.download.value(), file.uri, total_bytes);
        return touch(file.download);
    });
}

std::error_code DownloadLifecycleCoordinator::complete_file(const FileRef& file, FileStatus status,
                                                            std::uint64_t current_size) {
    if (auto ec = check_size(file, current_size)) {
        return ec;
    }
    return gateway_.transaction([&]() -> std::error_code {
        if (auto live = current_stage(file.download); !live) {
            return live.error();
        }
        auto state = read_file(file);
        if (!state) {
            return state.error();
        }
        if (current_size < state->current_size) {
            logger()->warn("Download {}: completing {} at {} would undo progress {}",
                           file.download.value(), file.uri, current_size, state->current_size);
            return make_error_code(Errc::progress_regression);
        }
        if (state->total_size != 0 && current_size > state->total_size) {
            return make_error_code(Errc::size_conflict);
        }

        // Status and size go out in one statement so no reader sees one without the other
        auto affected = gateway_.update(store::RecordKind::file,
                                        {field(col::FILE_CURRENT_SIZE, size_value(current_size)),
                                         field(col::FILE_STATUS, std::string(to_code(status)))},
                                        file_selection(file));
        if (!affected) {
            return affected.error();
        }
        logger()->debug("Download {}: {} is {} at {} bytes",
                        file.download.value(), file.uri, to_code(status), current_size);

        if (auto ec = roll_up(file.download, status)) {
            return ec;
        }
        return touch(file.download);
    });
}

//=============================================================================
// Stage transitions
//=============================================================================

std::error_code DownloadLifecycleCoordinator::update_download_stage(DownloadId id, Stage stage) {
    return gateway_.transaction([&]() -> std::error_code {
        auto current = current_stage(id);
        if (!current) {
            return current.error();
        }
        if (*current == stage) {
            return {};
        }
        if (current->is_terminal()) {
            logger()->warn("Download {}: refusing {} -> {}", id.value(), current->name(), stage.name());
            return make_error_code(Errc::invalid_transition);
        }
        if (auto ec = write_stage(id, stage)) {
            return ec;
        }
        logger()->info("Download {}: {} -> {}", id.value(), current->name(), stage.name());
        return {};
    });
}

std::error_code DownloadLifecycleCoordinator::requeue(DownloadId id) {
    return gateway_.transaction([&]() -> std::error_code {
        auto current = current_stage(id);
        if (!current) {
            return current.error();
        }
        if (auto ec = write_stage(id, Stage(StageCode::queued))) {
            return ec;
        }

        store::Selection files{std::format("{} = ?", col::FILE_DOWNLOAD_ID), {id.value()}};
        auto affected = gateway_.update(store::RecordKind::file,
                                        {field(col::FILE_CURRENT_SIZE, std::int64_t{0}),
                                         field(col::FILE_STATUS, std::string(to_code(FileStatus::incomplete)))},
                                        files);
        if (!affected) {
            return affected.error();
        }
        logger()->info("Download {}: requeued from {}", id.value(), current->name());
        return {};
    });
}

std::error_code DownloadLifecycleCoordinator::pause(DownloadId id) {
    return gateway_.transaction([&]() -> std::error_code {
        auto current = current_stage(id);
        if (!current) {
            return current.error();
        }
        if (*current == Stage(StageCode::paused_by_app)) {
            return {};
        }
        if (current->is_terminal()) {
            logger()->warn("Download {}: cannot pause from {}", id.value(), current->name());
            return make_error_code(Errc::invalid_transition);
        }
        if (auto ec = write_stage(id, Stage(StageCode::paused_by_app))) {
            return ec;
        }
        logger()->info("Download {}: paused", id.value());
        return {};
    });
}

std::error_code DownloadLifecycleCoordinator::resume(DownloadId id) {
    return gateway_.transaction([&]() -> std::error_code {
        auto current = current_stage(id);
        if (!current) {
            return current.error();
        }
        if (current->is_terminal()) {
            logger()->warn("Download {}: cannot resume from {}", id.value(), current->name());
            return make_error_code(Errc::invalid_transition);
        }
        if (!current->is_paused()) {
            return {};
        }
        if (auto ec = write_stage(id, Stage(StageCode::pending))) {
            return ec;
        }
        logger()->info("Download {}: resumed from {}", id.value(), current->name());
        return {};
    });
}

std::error_code DownloadLifecycleCoordinator::remove(const std::vector<DownloadId>& ids) {
    std::set<DownloadId> unique(ids.begin(), ids.end());

    return gateway_.transaction([&]() -> std::error_code {
        for (const auto& id : unique) {
            auto affected = gateway_.update(store::RecordKind::download,
                                            {field(col::DELETED, std::int64_t{1}),
                                             field(col::LAST_MODIFIED, clock_())},
                                            live_download(id));
            if (!affected) {
                return affected.error();
            }
            if (*affected == 0) {
                return make_error_code(Errc::not_found);
            }
            logger()->info("Download {}: removed", id.value());
        }
        return {};
    });
}

//=============================================================================
// Helpers
//=============================================================================

std::expected<Stage, std::error_code> DownloadLifecycleCoordinator::current_stage(DownloadId id) {
    auto cursor = gateway_.query(store::RecordKind::download, live_download(id));
    if (!cursor) {
        return std::unexpected(cursor.error());
    }
    auto row = (*cursor)->next();
    if (!row) {
        return std::unexpected(row.error());
    }
    if (!*row) {
        return std::unexpected(make_error_code(Errc::not_found));
    }
    auto stage = read_stage(**row, col::STAGE);
    if (!stage) {
        logger()->error("Download {}: unreadable stage ({})", id.value(), stage.error().message());
    }
    return stage;
}

std::expected<DownloadLifecycleCoordinator::FileState, std::error_code>
DownloadLifecycleCoordinator::read_file(const FileRef& file) {
    auto cursor = gateway_.query(store::RecordKind::file, file_selection(file));
    if (!cursor) {
        return std::unexpected(cursor.error());
    }
    auto row = (*cursor)->next();
    if (!row) {
        return std::unexpected(row.error());
    }
    if (!*row) {
        return std::unexpected(make_error_code(Errc::not_found));
    }

    auto current = read_size(**row, col::FILE_CURRENT_SIZE);
    auto total = read_size(**row, col::FILE_TOTAL_SIZE);
    auto code = read_text(**row, col::FILE_STATUS);
    if (!current || !total || !code) {
        logger()->error("Download {}: file row for {} is malformed", file.download.value(), file.uri);
        return std::unexpected(make_error_code(Errc::malformed_record));
    }
    auto status = file_status_from_code(*code);
    if (!status) {
        return std::unexpected(status.error());
    }
    return FileState{*current, *total, *status};
}

std::expected<std::vector<FileStatus>, std::error_code>
DownloadLifecycleCoordinator::file_statuses(DownloadId id) {
    store::Selection selection{std::format("{} = ?", col::FILE_DOWNLOAD_ID), {id.value()}};
    auto cursor = gateway_.query(store::RecordKind::file, selection);
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    std::vector<FileStatus> statuses;
    while (true) {
        auto row = (*cursor)->next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        auto code = read_text(**row, col::FILE_STATUS);
        if (!code) {
            return std::unexpected(code.error());
        }
        auto status = file_status_from_code(*code);
        if (!status) {
            return std::unexpected(status.error());
        }
        statuses.push_back(*status);
    }
    return statuses;
}

std::error_code DownloadLifecycleCoordinator::write_stage(DownloadId id, Stage stage) {
    auto affected = gateway_.update(store::RecordKind::download,
                                    {field(col::STAGE, static_cast<std::int64_t>(stage.code())),
                                     field(col::LAST_MODIFIED, clock_())},
                                    live_download(id));
    if (!affected) {
        return affected.error();
    }
    if (*affected == 0) {
        return make_error_code(Errc::not_found);
    }
    return {};
}

std::error_code DownloadLifecycleCoordinator::touch(DownloadId id) {
    auto affected = gateway_.update(store::RecordKind::download,
                                    {field(col::LAST_MODIFIED, clock_())},
                                    live_download(id));
    if (!affected) {
        return affected.error();
    }
    return {};
}

std::error_code DownloadLifecycleCoordinator::roll_up(DownloadId id, FileStatus completed) {
    auto current = current_stage(id);
    if (!current) {
        return current.error();
    }
    if (current->is_terminal()) {
        return {};
    }

    if (completed == FileStatus::failed) {
        logger()->info("Download {}: a file failed, {} -> {}", id.value(), current->name(),
                       Stage(StageCode::unknown_error).name());
        return write_stage(id, Stage(StageCode::unknown_error));
    }

    auto statuses = file_statuses(id);
    if (!statuses) {
        return statuses.error();
    }
    const bool all_done = !statuses->empty()
        && std::ranges::all_of(*statuses, [](FileStatus s) { return s == FileStatus::success; });
    if (all_done) {
        logger()->info("Download {}: all files complete, {} -> SUCCESS", id.value(), current->name());
        return write_stage(id, Stage(StageCode::success));
    }
    return {};
}

} // namespace parcel::core
