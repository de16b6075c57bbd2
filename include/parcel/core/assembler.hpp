// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/download.hpp>
#include <parcel/core/error.hpp>
#include <parcel/core/stage.hpp>
#include <parcel/store/gateway.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace parcel::core {

// Integer column that may be stored as INTEGER or as numeric TEXT.
// Missing, NULL or non-numeric content is Errc::malformed_record.
[[nodiscard]] std::expected<std::int64_t, std::error_code>
read_integer(const store::Row& row, std::string_view column) noexcept;

// Same as read_integer but rejects negative values
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
read_size(const store::Row& row, std::string_view column) noexcept;

// Stage column; values outside the stage table, including ones that do not
// fit an int, are Errc::unknown_stage
[[nodiscard]] std::expected<Stage, std::error_code>
read_stage(const store::Row& row, std::string_view column) noexcept;

// TEXT column; NULL reads as empty
[[nodiscard]] std::expected<std::string, std::error_code>
read_text(const store::Row& row, std::string_view column);

// Rebuilds Download aggregates from downloads_with_size and files rows
class DownloadRecordAssembler {
public:
    explicit DownloadRecordAssembler(store::Gateway& gateway) noexcept : gateway_(gateway) {}

    // A download without file rows is Errc::orphan_download
    [[nodiscard]] std::expected<Download, std::error_code> assemble(const store::Row& download_row) const;

    // Files in insertion order
    [[nodiscard]] std::expected<std::vector<DownloadFile>, std::error_code>
    assemble_files(DownloadId id) const;

private:
    [[nodiscard]] static std::expected<DownloadFile, std::error_code> assemble_file(const store::Row& row);

    store::Gateway& gateway_;
};

} // namespace parcel::core
