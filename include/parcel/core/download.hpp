// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/stage.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parcel::core {

// Process-unique download identifier; the generated key of the request row
class DownloadId {
public:
    constexpr DownloadId() noexcept = default;
    constexpr explicit DownloadId(std::int64_t value) noexcept : value_(value) {}

    [[nodiscard]] constexpr std::int64_t value() const noexcept { return value_; }
    [[nodiscard]] std::string to_string() const { return std::to_string(value_); }

    constexpr auto operator<=>(const DownloadId&) const noexcept = default;

private:
    std::int64_t value_{0};
};

using BatchId = std::int64_t;

struct DownloadFile {
    std::string uri;         // upstream source, natural key within a download
    std::string local_uri;   // destination
    std::uint64_t current_size{0};
    std::uint64_t total_size{0};  // 0 until the transport reports a length
    FileStatus status{FileStatus::incomplete};
};

// Identifies one file row for updates
struct FileRef {
    DownloadId download;
    std::string uri;
};

struct Download {
    DownloadId id;
    std::optional<BatchId> batch_id;
    std::uint64_t current_size{0};  // sum over files
    std::uint64_t total_size{0};    // sum over files
    Stage stage;
    Status status{Status::pending};
    std::vector<DownloadFile> files;

    [[nodiscard]] double percent() const noexcept {
        if (total_size == 0) return 0.0;
        return static_cast<double>(current_size) * 100.0 / static_cast<double>(total_size);
    }
};

struct DownloadRequest {
    struct File {
        std::string identifier;  // caller-chosen label, may be empty
        std::string uri;
        std::string local_uri;
    };

    std::optional<BatchId> batch_id;
    std::optional<std::string> extra;
    bool visible{true};
    std::vector<File> files;
};

} // namespace parcel::core
