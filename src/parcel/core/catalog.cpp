// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/catalog.hpp>
#include <parcel/core/log.hpp>
#include <parcel/store/error.hpp>
#include <parcel/store/schema.hpp>
#include <algorithm>
#include <format>

namespace parcel::core {

namespace col = store::columns;

namespace {

bool is_record_fault(const std::error_code& ec) noexcept {
    return ec == Errc::malformed_record || ec == Errc::orphan_download || ec == Errc::unknown_stage;
}

} // namespace

std::expected<Download, std::error_code> DownloadCatalog::get(DownloadId id) const {
    auto compiled = Query().filter_by_id({id}).build();
    if (!compiled) {
        return std::unexpected(compiled.error());
    }

    auto cursor = gateway_.query(store::RecordKind::download_with_size, compiled->selection);
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
    return assembler_.assemble(**row);
}

std::expected<std::vector<Download>, std::error_code>
DownloadCatalog::list(const Query& query, MalformedPolicy policy) const {
    auto compiled = query.build();
    if (!compiled) {
        return std::unexpected(compiled.error());
    }

    auto cursor = gateway_.query(store::RecordKind::download_with_size, compiled->selection, compiled->order_by);
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    std::vector<Download> downloads;
    while (true) {
        auto row = (*cursor)->next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }

        auto download = assembler_.assemble(**row);
        if (download) {
            downloads.push_back(std::move(*download));
            continue;
        }
        if (policy == MalformedPolicy::skip && is_record_fault(download.error())) {
            logger()->warn("Skipping unreadable download record: {}", download.error().message());
            continue;
        }
        return std::unexpected(download.error());
    }
    return downloads;
}

std::expected<Status, std::error_code> DownloadCatalog::batch_status(BatchId batch) const {
    store::Selection selection{
        std::format("{} = ? AND {} != 1", col::BATCH_ID, col::DELETED),
        {batch},
    };
    auto cursor = gateway_.query(store::RecordKind::download, selection);
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    std::vector<Status> members;
    while (true) {
        auto row = (*cursor)->next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        auto stage = read_stage(**row, col::STAGE);
        if (!stage) {
            logger()->error("Batch {}: unreadable stage ({})", batch, stage.error().message());
            return std::unexpected(stage.error());
        }
        members.push_back(stage->category());
    }

    if (members.empty()) {
        return std::unexpected(make_error_code(Errc::not_found));
    }
    return aggregate_status(members);
}

Status aggregate_status(const std::vector<Status>& members) noexcept {
    auto any = [&](Status s) { return std::ranges::find(members, s) != members.end(); };

    if (any(Status::failed)) return Status::failed;
    if (any(Status::running)) return Status::running;
    if (any(Status::paused)) return Status::paused;
    if (any(Status::pending)) return Status::pending;
    return Status::successful;
}

} // namespace parcel::core
