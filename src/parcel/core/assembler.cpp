// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/assembler.hpp>
#include <parcel/core/log.hpp>
#include <parcel/store/schema.hpp>
#include <charconv>
#include <limits>
#include <format>

namespace parcel::core {

namespace col = store::columns;

std::expected<std::int64_t, std::error_code>
read_integer(const store::Row& row, std::string_view column) noexcept {
    const store::Value* value = row.get(column);
    if (value == nullptr) {
        return std::unexpected(make_error_code(Errc::malformed_record));
    }
    if (const auto* number = std::get_if<std::int64_t>(value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        std::int64_t parsed = 0;
        const char* first = text->data();
        const char* last = text->data() + text->size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec == std::errc{} && ptr == last && !text->empty()) {
            return parsed;
        }
    }
    return std::unexpected(make_error_code(Errc::malformed_record));
}

std::expected<std::uint64_t, std::error_code>
read_size(const store::Row& row, std::string_view column) noexcept {
    auto value = read_integer(row, column);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (*value < 0) {
        return std::unexpected(make_error_code(Errc::malformed_record));
    }
    return static_cast<std::uint64_t>(*value);
}

std::expected<Stage, std::error_code>
read_stage(const store::Row& row, std::string_view column) noexcept {
    auto code = read_integer(row, column);
    if (!code) {
        return std::unexpected(code.error());
    }
    if (*code < std::numeric_limits<int>::min() || *code > std::numeric_limits<int>::max()) {
        return std::unexpected(make_error_code(Errc::unknown_stage));
    }
    return Stage::from_code(static_cast<int>(*code));
}

std::expected<std::string, std::error_code>
read_text(const store::Row& row, std::string_view column) {
    const store::Value* value = row.get(column);
    if (value == nullptr) {
        return std::unexpected(make_error_code(Errc::malformed_record));
    }
    if (std::holds_alternative<std::monostate>(*value)) {
        return std::string();
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return *text;
    }
    return std::unexpected(make_error_code(Errc::malformed_record));
}

std::expected<Download, std::error_code> DownloadRecordAssembler::assemble(const store::Row& row) const {
    auto id = read_integer(row, col::ID);
    if (!id) {
        logger()->error("Download row without a usable id");
        return std::unexpected(id.error());
    }

    Download download;
    download.id = DownloadId(*id);

    auto stage = read_stage(row, col::STAGE);
    if (!stage) {
        logger()->error("Download {}: unreadable stage ({})", *id, stage.error().message());
        return std::unexpected(stage.error());
    }
    download.stage = *stage;
    download.status = stage->category();

    if (const store::Value* batch = row.get(col::BATCH_ID);
        batch != nullptr && !std::holds_alternative<std::monostate>(*batch)) {
        auto batch_id = read_integer(row, col::BATCH_ID);
        if (!batch_id) {
            logger()->error("Download {}: malformed batch id", *id);
            return std::unexpected(batch_id.error());
        }
        download.batch_id = *batch_id;
    }

    auto current = read_size(row, col::CURRENT_SIZE);
    auto total = read_size(row, col::TOTAL_SIZE);
    if (!current || !total) {
        logger()->error("Download {}: malformed size columns", *id);
        return std::unexpected(make_error_code(Errc::malformed_record));
    }
    download.current_size = *current;
    download.total_size = *total;

    auto files = assemble_files(download.id);
    if (!files) {
        return std::unexpected(files.error());
    }
    if (files->empty()) {
        logger()->error("Download {} has no files", *id);
        return std::unexpected(make_error_code(Errc::orphan_download));
    }
    download.files = std::move(*files);
    return download;
}

std::expected<std::vector<DownloadFile>, std::error_code>
DownloadRecordAssembler::assemble_files(DownloadId id) const {
    store::Selection selection{std::format("{} = ?", col::FILE_DOWNLOAD_ID), {id.value()}};
    auto cursor = gateway_.query(store::RecordKind::file, selection, col::ID);
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    std::vector<DownloadFile> files;
    while (true) {
        auto row = (*cursor)->next();
        if (!row) {
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        auto file = assemble_file(**row);
        if (!file) {
            logger()->error("Download {}: malformed file row", id.value());
            return std::unexpected(file.error());
        }
        files.push_back(std::move(*file));
    }
    return files;
}

std::expected<DownloadFile, std::error_code> DownloadRecordAssembler::assemble_file(const store::Row& row) {
    DownloadFile file;

    auto uri = read_text(row, col::FILE_URI);
    auto local_uri = read_text(row, col::FILE_LOCAL_URI);
    auto status_code = read_text(row, col::FILE_STATUS);
    if (!uri || !local_uri || !status_code) {
        return std::unexpected(make_error_code(Errc::malformed_record));
    }

    auto status = file_status_from_code(*status_code);
    if (!status) {
        return std::unexpected(status.error());
    }

    auto current = read_size(row, col::FILE_CURRENT_SIZE);
    if (!current) {
        return std::unexpected(current.error());
    }
    auto total = read_size(row, col::FILE_TOTAL_SIZE);
    if (!total) {
        return std::unexpected(total.error());
    }

    file.uri = std::move(*uri);
    file.local_uri = std::move(*local_uri);
    file.status = *status;
    file.current_size = *current;
    file.total_size = *total;
    return file;
}

} // namespace parcel::core
