// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/cli/render.hpp>
#include <algorithm>
#include <cmath>
#include <format>

namespace parcel::cli {

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return std::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    } else if (bytes >= GB) {
        return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        return std::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        return std::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    }
    return std::format("{} B", bytes);
}

std::string render_bar(std::uint64_t current, std::uint64_t total, int width) {
    double percent = 0.0;
    if (total > 0) {
        percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
    }

    const int filled = static_cast<int>(std::round(width * percent / 100.0));
    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += filled < width ? ">" : "";
    bar.append(static_cast<std::size_t>(std::max(0, width - filled - 1)), ' ');
    bar += "]";
    return bar;
}

std::string render_download(const core::Download& download, bool with_files) {
    std::string out = std::format("#{:<6} {:<20} {:<10} {} {:>3}% ({}/{})",
                                  download.id.value(),
                                  download.stage.name(),
                                  core::to_string(download.status),
                                  render_bar(download.current_size, download.total_size),
                                  static_cast<int>(download.percent()),
                                  format_bytes(download.current_size),
                                  format_bytes(download.total_size));
    if (download.batch_id) {
        out += std::format("  batch {}", *download.batch_id);
    }
    out += '\n';

    if (with_files) {
        for (const auto& file : download.files) {
            out += std::format("    {:<10} {} -> {} ({}/{})\n",
                               core::to_code(file.status), file.uri, file.local_uri,
                               format_bytes(file.current_size), format_bytes(file.total_size));
        }
    }
    return out;
}

} // namespace parcel::cli
