// Copyright (c) 2026 changcheng967. All rights reserved.

#include "test_support.hpp"
#include <parcel/core/log.hpp>
#include <parcel/store/error.hpp>
#include <atomic>
#include <limits>
#include <thread>

using namespace parcel;
using namespace parcel::core;

namespace {

const std::string FILE_1 = "https://example.com/one.bin";
const std::string FILE_2 = "https://example.com/two.bin";

} // namespace

TEST_CASE("Two file download from submit to success", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway, test::StepClock{});
    DownloadCatalog catalog(*gateway);

    auto id = coordinator.submit(test::request_for({FILE_1, FILE_2}));
    REQUIRE(id.has_value());

    auto queued = catalog.get(*id);
    REQUIRE(queued.has_value());
    CHECK(queued->stage == Stage(StageCode::queued));
    CHECK(queued->current_size == 0);
    REQUIRE(queued->files.size() == 2);
    CHECK(queued->files[0].status == FileStatus::incomplete);
    CHECK(queued->files[1].status == FileStatus::incomplete);

    REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::running)));
    REQUIRE_FALSE(coordinator.record_file_progress({*id, FILE_1}, 500));
    CHECK(catalog.get(*id)->current_size == 500);

    REQUIRE_FALSE(coordinator.record_file_total_size({*id, FILE_1}, 1000));
    REQUIRE_FALSE(coordinator.record_file_total_size({*id, FILE_2}, 2000));
    CHECK(catalog.get(*id)->total_size == 3000);

    REQUIRE_FALSE(coordinator.complete_file({*id, FILE_1}, FileStatus::success, 1000));
    CHECK(catalog.get(*id)->stage == Stage(StageCode::running));

    REQUIRE_FALSE(coordinator.complete_file({*id, FILE_2}, FileStatus::success, 2000));

    auto finished = catalog.get(*id);
    REQUIRE(finished.has_value());
    CHECK(finished->stage == Stage(StageCode::success));
    CHECK(finished->status == Status::successful);
    CHECK(finished->current_size == 3000);
    CHECK(finished->total_size == 3000);
}

TEST_CASE("submit validation and atomicity", "[lifecycle]") {
    auto gateway = test::open_memory_store();

    SECTION("Empty file list") {
        DownloadLifecycleCoordinator coordinator(*gateway);
        auto id = coordinator.submit(DownloadRequest{});
        REQUIRE_FALSE(id.has_value());
        CHECK(id.error() == Errc::invalid_request);
    }

    SECTION("Repeated upstream URI") {
        DownloadLifecycleCoordinator coordinator(*gateway);
        auto id = coordinator.submit(test::request_for({FILE_1, FILE_1}));
        CHECK(id.error() == Errc::invalid_request);
        CHECK(test::count_rows(*gateway, store::RecordKind::download) == 0);
    }

    SECTION("Empty destination") {
        DownloadLifecycleCoordinator coordinator(*gateway);
        DownloadRequest request;
        request.files.push_back({"", FILE_1, ""});
        CHECK(coordinator.submit(request).error() == Errc::invalid_request);
    }

    SECTION("Failed file insert leaves no download behind") {
        test::FailingBulkInsertGateway failing(*gateway);
        DownloadLifecycleCoordinator coordinator(failing);

        auto id = coordinator.submit(test::request_for({FILE_1, FILE_2}));
        REQUIRE_FALSE(id.has_value());
        CHECK(store::is_persistence_failure(id.error()));

        CHECK(test::count_rows(*gateway, store::RecordKind::download) == 0);
        CHECK(test::count_rows(*gateway, store::RecordKind::file) == 0);
        CHECK(test::count_rows(*gateway, store::RecordKind::request) == 0);
    }

    SECTION("Ids are distinct") {
        DownloadLifecycleCoordinator coordinator(*gateway);
        auto a = coordinator.submit(test::request_for({FILE_1}));
        auto b = coordinator.submit(test::request_for({FILE_1}));
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(*a != *b);
    }
}

TEST_CASE("record_file_progress is monotonic", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1}));
    REQUIRE(id.has_value());
    FileRef file{*id, FILE_1};

    SECTION("Increasing values succeed") {
        for (std::uint64_t bytes : {10u, 20u, 400u, 401u}) {
            REQUIRE_FALSE(coordinator.record_file_progress(file, bytes));
        }
        CHECK(catalog.get(*id)->files[0].current_size == 401);
    }

    SECTION("Repeating the value is accepted") {
        REQUIRE_FALSE(coordinator.record_file_progress(file, 50));
        REQUIRE_FALSE(coordinator.record_file_progress(file, 50));
    }

    SECTION("Regression is rejected and leaves the value") {
        REQUIRE_FALSE(coordinator.record_file_progress(file, 300));
        CHECK(coordinator.record_file_progress(file, 299) == Errc::progress_regression);
        CHECK(catalog.get(*id)->files[0].current_size == 300);
    }

    SECTION("Progress past a known total is rejected") {
        REQUIRE_FALSE(coordinator.record_file_total_size(file, 100));
        CHECK(coordinator.record_file_progress(file, 101) == Errc::size_conflict);
        REQUIRE_FALSE(coordinator.record_file_progress(file, 100));
    }

    SECTION("Unknown file") {
        CHECK(coordinator.record_file_progress({*id, "https://example.com/nope"}, 1) == Errc::not_found);
        CHECK(coordinator.record_file_progress({DownloadId(999), FILE_1}, 1) == Errc::not_found);
    }
}

TEST_CASE("Sizes that do not fit the store are rejected", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1}));
    REQUIRE(id.has_value());
    FileRef file{*id, FILE_1};

    constexpr auto largest = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    CHECK(coordinator.record_file_total_size(file, largest + 6) == Errc::invalid_request);
    CHECK(coordinator.record_file_progress(file, largest + 1) == Errc::invalid_request);
    CHECK(coordinator.complete_file(file, FileStatus::success, std::numeric_limits<std::uint64_t>::max())
          == Errc::invalid_request);

    auto download = catalog.get(*id);
    REQUIRE(download.has_value());
    CHECK(download->total_size == 0);
    CHECK(download->current_size == 0);
    CHECK(download->files[0].status == FileStatus::incomplete);

    REQUIRE_FALSE(coordinator.record_file_total_size(file, largest));
    CHECK(catalog.get(*id)->total_size == largest);
}

TEST_CASE("record_file_total_size", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1}));
    REQUIRE(id.has_value());
    FileRef file{*id, FILE_1};

    REQUIRE_FALSE(coordinator.record_file_total_size(file, 5000));
    REQUIRE_FALSE(coordinator.record_file_total_size(file, 5000));
    REQUIRE_FALSE(coordinator.record_file_progress(file, 4000));

    SECTION("A larger total is still allowed") {
        REQUIRE_FALSE(coordinator.record_file_total_size(file, 6000));
        CHECK(catalog.get(*id)->total_size == 6000);
    }

    SECTION("A total below progress conflicts") {
        CHECK(coordinator.record_file_total_size(file, 3000) == Errc::size_conflict);
        CHECK(catalog.get(*id)->total_size == 5000);
    }
}

TEST_CASE("Concurrent progress on one file stays monotonic", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1}));
    REQUIRE(id.has_value());

    // Every rejected write logs a warning
    const auto level = logger()->level();
    logger()->set_level(spdlog::level::err);

    constexpr std::uint64_t WRITERS = 4;
    constexpr std::uint64_t LAST_VALUE = 1999;

    std::atomic<int> regressions{0};
    std::atomic<int> other_errors{0};
    std::atomic<int> read_errors{0};
    std::atomic<int> went_back{0};
    std::atomic<bool> writing{true};

    std::vector<std::thread> writers;
    for (std::uint64_t w = 0; w < WRITERS; ++w) {
        writers.emplace_back([&, w] {
            for (std::uint64_t bytes = w; bytes <= LAST_VALUE; bytes += WRITERS) {
                auto ec = coordinator.record_file_progress({*id, FILE_1}, bytes);
                if (ec == Errc::progress_regression) {
                    ++regressions;
                } else if (ec) {
                    ++other_errors;
                }
            }
        });
    }

    std::thread reader([&] {
        std::uint64_t seen = 0;
        while (writing) {
            auto downloads = catalog.list(Query());
            if (!downloads || downloads->size() != 1) {
                ++read_errors;
                continue;
            }
            const auto current = downloads->front().current_size;
            if (current < seen) {
                ++went_back;
            }
            seen = current;
        }
    });

    for (auto& writer : writers) {
        writer.join();
    }
    writing = false;
    reader.join();
    logger()->set_level(level);

    CHECK(other_errors.load() == 0);
    CHECK(read_errors.load() == 0);
    CHECK(went_back.load() == 0);
    INFO("rejected as regressions: " << regressions.load());

    auto download = catalog.get(*id);
    REQUIRE(download.has_value());
    CHECK(download->files[0].current_size == LAST_VALUE);
}

TEST_CASE("complete_file", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1, FILE_2}));
    REQUIRE(id.has_value());
    REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::running)));

    SECTION("Status and size are written together") {
        REQUIRE_FALSE(coordinator.complete_file({*id, FILE_1}, FileStatus::paused, 700));
        auto download = catalog.get(*id);
        REQUIRE(download.has_value());
        CHECK(download->files[0].status == FileStatus::paused);
        CHECK(download->files[0].current_size == 700);
        CHECK(download->stage == Stage(StageCode::running));
    }

    SECTION("A failed file fails the download") {
        REQUIRE_FALSE(coordinator.complete_file({*id, FILE_2}, FileStatus::failed, 0));
        auto download = catalog.get(*id);
        REQUIRE(download.has_value());
        CHECK(download->stage == Stage(StageCode::unknown_error));
        CHECK(download->status == Status::failed);
    }

    SECTION("A failure after a terminal stage keeps that stage") {
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::canceled)));
        REQUIRE_FALSE(coordinator.complete_file({*id, FILE_2}, FileStatus::failed, 0));
        CHECK(catalog.get(*id)->stage == Stage(StageCode::canceled));
    }

    SECTION("Completing below recorded progress is a regression") {
        REQUIRE_FALSE(coordinator.record_file_progress({*id, FILE_1}, 800));
        CHECK(coordinator.complete_file({*id, FILE_1}, FileStatus::success, 10) == Errc::progress_regression);
        CHECK(catalog.get(*id)->files[0].status == FileStatus::incomplete);
    }
}

TEST_CASE("update_download_stage transitions", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1}));
    REQUIRE(id.has_value());

    SECTION("Paused variants can go back to running") {
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::running)));
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::waiting_to_retry)));
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::pending)));
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::running)));
        CHECK(catalog.get(*id)->status == Status::running);
    }

    SECTION("Same stage is a no-op") {
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::running)));
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::running)));
    }

    SECTION("Success cannot go back to pending") {
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::success)));
        CHECK(coordinator.update_download_stage(*id, Stage(StageCode::pending)) == Errc::invalid_transition);
        CHECK(catalog.get(*id)->stage == Stage(StageCode::success));
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::success)));
    }

    SECTION("Failure is terminal too") {
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::http_data_error)));
        CHECK(coordinator.update_download_stage(*id, Stage(StageCode::running)) == Errc::invalid_transition);
        CHECK(coordinator.update_download_stage(*id, Stage(StageCode::success)) == Errc::invalid_transition);
    }

    SECTION("Requeue restarts a finished download") {
        REQUIRE_FALSE(coordinator.record_file_total_size({*id, FILE_1}, 100));
        REQUIRE_FALSE(coordinator.complete_file({*id, FILE_1}, FileStatus::success, 100));
        REQUIRE(catalog.get(*id)->stage == Stage(StageCode::success));

        REQUIRE_FALSE(coordinator.requeue(*id));
        auto download = catalog.get(*id);
        REQUIRE(download.has_value());
        CHECK(download->stage == Stage(StageCode::queued));
        CHECK(download->current_size == 0);
        CHECK(download->total_size == 100);
        CHECK(download->files[0].status == FileStatus::incomplete);
    }

    SECTION("Unknown download") {
        CHECK(coordinator.update_download_stage(DownloadId(31337), Stage(StageCode::running)) == Errc::not_found);
        CHECK(coordinator.requeue(DownloadId(31337)) == Errc::not_found);
    }
}

TEST_CASE("pause, resume and remove", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);
    auto id = coordinator.submit(test::request_for({FILE_1}));
    REQUIRE(id.has_value());

    SECTION("Pause then resume") {
        REQUIRE_FALSE(coordinator.pause(*id));
        CHECK(catalog.get(*id)->stage == Stage(StageCode::paused_by_app));
        REQUIRE_FALSE(coordinator.pause(*id));
        REQUIRE_FALSE(coordinator.resume(*id));
        CHECK(catalog.get(*id)->stage == Stage(StageCode::pending));
        REQUIRE_FALSE(coordinator.resume(*id));
        CHECK(catalog.get(*id)->stage == Stage(StageCode::pending));
    }

    SECTION("Finished downloads cannot be paused or resumed") {
        REQUIRE_FALSE(coordinator.update_download_stage(*id, Stage(StageCode::success)));
        CHECK(coordinator.pause(*id) == Errc::invalid_transition);
        CHECK(coordinator.resume(*id) == Errc::invalid_transition);
    }

    SECTION("Removed downloads are gone for every operation") {
        REQUIRE_FALSE(coordinator.remove({*id}));
        CHECK(catalog.get(*id).error() == Errc::not_found);
        CHECK(coordinator.pause(*id) == Errc::not_found);
        CHECK(coordinator.remove({*id}) == Errc::not_found);
        CHECK(coordinator.record_file_progress({*id, FILE_1}, 10) == Errc::not_found);
        CHECK(coordinator.record_file_total_size({*id, FILE_1}, 100) == Errc::not_found);
        CHECK(coordinator.complete_file({*id, FILE_1}, FileStatus::success, 0) == Errc::not_found);
        CHECK(test::count_rows(*gateway, store::RecordKind::download) == 1);
    }

    SECTION("Removing with an unknown id removes nothing") {
        CHECK(coordinator.remove({*id, DownloadId(4242)}) == Errc::not_found);
        CHECK(catalog.get(*id).has_value());
    }
}

TEST_CASE("Batch status", "[lifecycle]") {
    auto gateway = test::open_memory_store();
    DownloadLifecycleCoordinator coordinator(*gateway);
    DownloadCatalog catalog(*gateway);

    auto submit = [&](BatchId batch, const std::string& uri) {
        auto request = test::request_for({uri});
        request.batch_id = batch;
        auto id = coordinator.submit(request);
        REQUIRE(id.has_value());
        return *id;
    };

    auto a = submit(1, FILE_1);
    auto b = submit(1, FILE_2);

    CHECK(catalog.batch_status(1) == Status::pending);

    REQUIRE_FALSE(coordinator.update_download_stage(a, Stage(StageCode::running)));
    CHECK(catalog.batch_status(1) == Status::running);

    REQUIRE_FALSE(coordinator.update_download_stage(a, Stage(StageCode::success)));
    REQUIRE_FALSE(coordinator.update_download_stage(b, Stage(StageCode::waiting_for_network)));
    CHECK(catalog.batch_status(1) == Status::paused);

    REQUIRE_FALSE(coordinator.update_download_stage(b, Stage(StageCode::success)));
    CHECK(catalog.batch_status(1) == Status::successful);

    auto c = submit(1, "https://example.com/three.bin");
    REQUIRE_FALSE(coordinator.update_download_stage(c, Stage(StageCode::insufficient_space)));
    CHECK(catalog.batch_status(1) == Status::failed);

    REQUIRE_FALSE(coordinator.remove({c}));
    CHECK(catalog.batch_status(1) == Status::successful);

    CHECK(catalog.batch_status(2).error() == Errc::not_found);
}

TEST_CASE("aggregate_status precedence", "[lifecycle]") {
    CHECK(aggregate_status({Status::successful, Status::failed, Status::running}) == Status::failed);
    CHECK(aggregate_status({Status::paused, Status::running}) == Status::running);
    CHECK(aggregate_status({Status::pending, Status::paused}) == Status::paused);
    CHECK(aggregate_status({Status::successful, Status::pending}) == Status::pending);
    CHECK(aggregate_status({Status::successful}) == Status::successful);
}
