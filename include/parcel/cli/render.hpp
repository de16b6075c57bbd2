// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/download.hpp>
#include <cstdint>
#include <string>

namespace parcel::cli {

// "512 B", "3 KB", "1.5 MB", "2.00 GB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// "[=======>      ]"; an unknown total renders an empty bar
[[nodiscard]] std::string render_bar(std::uint64_t current, std::uint64_t total, int width = 30);

// One summary line followed by one line per file
[[nodiscard]] std::string render_download(const core::Download& download, bool with_files);

} // namespace parcel::cli
