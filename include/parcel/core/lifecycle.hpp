// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/download.hpp>
#include <parcel/core/error.hpp>
#include <parcel/core/stage.hpp>
#include <parcel/store/gateway.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <vector>

namespace parcel::core {

// Drives downloads and their files through their stages. Only stages are
// persisted; the public status is always derived from the stage on read.
//
// QUEUED -> PENDING -> RUNNING -> SUCCESS | paused variant | failure code.
// Paused variants may return to PENDING or RUNNING. SUCCESS and failure
// codes are terminal; only requeue() leaves them.
class DownloadLifecycleCoordinator {
public:
    // Milliseconds since the epoch, stamped into last_modified
    using Clock = std::function<std::int64_t()>;

    explicit DownloadLifecycleCoordinator(store::Gateway& gateway, Clock clock = {});

    // Creates the download (QUEUED) and all of its files (INCOMPLETE) in one
    // transaction. Empty file lists, empty URIs and repeated upstream URIs
    // are Errc::invalid_request.
    [[nodiscard]] std::expected<DownloadId, std::error_code> submit(const DownloadRequest& request);

    // Progress never goes backwards (Errc::progress_regression) and never
    // passes a known total (Errc::size_conflict). For every file update, a
    // removed download is Errc::not_found and a size above INT64_MAX is
    // Errc::invalid_request.
    [[nodiscard]] std::error_code record_file_progress(const FileRef& file, std::uint64_t bytes_written);

    // Repeating the stored value is a no-op; a total below committed
    // progress is Errc::size_conflict
    [[nodiscard]] std::error_code record_file_total_size(const FileRef& file, std::uint64_t total_bytes);

    // Writes status and size together, then rolls the download stage up:
    // all files SUCCESS -> SUCCESS, a FAILED file -> UNKNOWN_ERROR
    [[nodiscard]] std::error_code complete_file(const FileRef& file, FileStatus status, std::uint64_t current_size);

    // Same stage is a no-op; leaving a terminal stage is Errc::invalid_transition
    [[nodiscard]] std::error_code update_download_stage(DownloadId id, Stage stage);

    // Operator restart from any stage: QUEUED, files reset to INCOMPLETE at 0 bytes
    [[nodiscard]] std::error_code requeue(DownloadId id);

    [[nodiscard]] std::error_code pause(DownloadId id);
    [[nodiscard]] std::error_code resume(DownloadId id);

    // Soft delete; all ids or none
    [[nodiscard]] std::error_code remove(const std::vector<DownloadId>& ids);

private:
    struct FileState {
        std::uint64_t current_size{0};
        std::uint64_t total_size{0};
        FileStatus status{FileStatus::incomplete};
    };

    [[nodiscard]] std::expected<DownloadId, std::error_code> create_request();
    [[nodiscard]] std::expected<Stage, std::error_code> current_stage(DownloadId id);
    [[nodiscard]] std::expected<FileState, std::error_code> read_file(const FileRef& file);
    [[nodiscard]] std::expected<std::vector<FileStatus>, std::error_code> file_statuses(DownloadId id);
    [[nodiscard]] std::error_code write_stage(DownloadId id, Stage stage);
    [[nodiscard]] std::error_code touch(DownloadId id);
    [[nodiscard]] std::error_code roll_up(DownloadId id, FileStatus completed);

    store::Gateway& gateway_;
    Clock clock_;
    std::atomic<std::uint64_t> request_counter_{0};
};

} // namespace parcel::core
