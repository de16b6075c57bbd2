// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/assembler.hpp>
#include <parcel/core/download.hpp>
#include <parcel/core/query.hpp>
#include <parcel/store/gateway.hpp>
#include <expected>
#include <vector>

namespace parcel::core {

// What list() does with a row that cannot be assembled
enum class MalformedPolicy : std::uint8_t {
    fail,  // the whole query fails with the record's error
    skip,  // the record is logged and left out
};

// Read side: runs Query filters and returns assembled downloads
class DownloadCatalog {
public:
    explicit DownloadCatalog(store::Gateway& gateway) noexcept
        : gateway_(gateway)
        , assembler_(gateway) {}

    // Errc::not_found for a missing or removed download
    [[nodiscard]] std::expected<Download, std::error_code> get(DownloadId id) const;

    [[nodiscard]] std::expected<std::vector<Download>, std::error_code>
    list(const Query& query, MalformedPolicy policy = MalformedPolicy::fail) const;

    // Aggregate category of the batch members; Errc::not_found for an empty batch
    [[nodiscard]] std::expected<Status, std::error_code> batch_status(BatchId batch) const;

private:
    store::Gateway& gateway_;
    DownloadRecordAssembler assembler_;
};

// FAILED if any member failed, then RUNNING, PAUSED, PENDING, and
// SUCCESSFUL only when every member succeeded
[[nodiscard]] Status aggregate_status(const std::vector<Status>& members) noexcept;

} // namespace parcel::core
