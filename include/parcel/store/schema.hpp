// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace parcel::store::columns {

// requests
constexpr std::string_view ID = "_id";
constexpr std::string_view REQUEST_TIMESTAMP = "request_timestamp";

// downloads
constexpr std::string_view BATCH_ID = "batch_id";
constexpr std::string_view STAGE = "stage";
constexpr std::string_view EXTRAS = "extras";
constexpr std::string_view VISIBLE = "visible";
constexpr std::string_view DELETED = "deleted";
constexpr std::string_view LAST_MODIFIED = "last_modified";

// downloads_with_size
constexpr std::string_view CURRENT_SIZE = "current_size";
constexpr std::string_view TOTAL_SIZE = "total_size";
constexpr std::string_view FILE_COUNT = "file_count";

// files
constexpr std::string_view FILE_DOWNLOAD_ID = "download_id";
constexpr std::string_view FILE_IDENTIFIER = "identifier";
constexpr std::string_view FILE_URI = "uri";
constexpr std::string_view FILE_LOCAL_URI = "local_uri";
constexpr std::string_view FILE_CURRENT_SIZE = "current_size";
constexpr std::string_view FILE_TOTAL_SIZE = "total_size";
constexpr std::string_view FILE_STATUS = "status";

} // namespace parcel::store::columns
