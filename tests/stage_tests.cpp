// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <parcel/core/stage.hpp>
#include <type_traits>

using namespace parcel::core;

TEST_CASE("category_of - named stages", "[stage]") {
    SECTION("Success") {
        CHECK(category_of(200) == Status::successful);
    }

    SECTION("Paused variants") {
        for (auto code : {StageCode::paused_by_app, StageCode::waiting_to_retry,
                          StageCode::waiting_for_network, StageCode::queued_for_wifi}) {
            INFO("code " << static_cast<int>(code));
            CHECK(category_of(static_cast<int>(code)) == Status::paused);
        }
    }

    SECTION("Pending and running") {
        CHECK(category_of(static_cast<int>(StageCode::pending)) == Status::pending);
        CHECK(category_of(static_cast<int>(StageCode::queued)) == Status::pending);
        CHECK(category_of(static_cast<int>(StageCode::running)) == Status::running);
    }

    SECTION("Named failures") {
        CHECK(category_of(static_cast<int>(StageCode::canceled)) == Status::failed);
        CHECK(category_of(static_cast<int>(StageCode::insufficient_space)) == Status::failed);
    }
}

TEST_CASE("category_of - failure range", "[stage]") {
    for (int code = 300; code < 700; ++code) {
        auto category = category_of(code);
        INFO("code " << code);
        if (code >= 400 && code < 600) {
            REQUIRE(category.has_value());
            CHECK(*category == Status::failed);
        } else {
            REQUIRE_FALSE(category.has_value());
            CHECK(category.error() == Errc::unknown_stage);
        }
    }
}

TEST_CASE("category_of - unmapped codes", "[stage]") {
    CHECK(category_of(0).error() == Errc::unknown_stage);
    CHECK(category_of(191).error() == Errc::unknown_stage);
    CHECK(category_of(199).error() == Errc::unknown_stage);
    CHECK(category_of(201).error() == Errc::unknown_stage);
    CHECK(category_of(-400).error() == Errc::unknown_stage);
    CHECK(category_of(600).error() == Errc::unknown_stage);
}

TEST_CASE("Stage construction", "[stage]") {
    SECTION("Default is queued") {
        Stage stage;
        CHECK(stage == Stage(StageCode::queued));
        CHECK(stage.category() == Status::pending);
        CHECK_FALSE(stage.is_terminal());
    }

    SECTION("from_code validates") {
        REQUIRE(Stage::from_code(451).has_value());
        CHECK(Stage::from_code(451)->is_failure());
        CHECK(Stage::from_code(451)->name() == "FAILED_451");
        CHECK(Stage::from_code(150).error() == Errc::unknown_stage);
    }

    SECTION("Raw codes only enter through from_code") {
        STATIC_REQUIRE_FALSE(std::is_convertible_v<StageCode, Stage>);
        STATIC_REQUIRE(std::is_constructible_v<Stage, StageCode>);
        CHECK(Stage::from_code(777).error() == Errc::unknown_stage);
        CHECK(Stage::from_code(-200).error() == Errc::unknown_stage);
    }

    SECTION("parse accepts names and numbers") {
        CHECK(Stage::parse("WAITING_FOR_NETWORK")->code() == 195);
        CHECK(Stage::parse("waiting_for_network")->code() == 195);
        CHECK(Stage::parse("200")->is_success());
        CHECK(Stage::parse("496")->name() == "HTTP_EXCEPTION");
        CHECK_FALSE(Stage::parse("SLEEPING").has_value());
        CHECK_FALSE(Stage::parse("12x").has_value());
    }

    SECTION("Terminal stages") {
        CHECK(Stage(StageCode::success).is_terminal());
        CHECK(Stage(StageCode::file_error).is_terminal());
        CHECK_FALSE(Stage(StageCode::running).is_terminal());
        CHECK_FALSE(Stage(StageCode::queued_for_wifi).is_terminal());
        CHECK(Stage(StageCode::queued_for_wifi).is_paused());
    }
}

TEST_CASE("Status names and masks", "[stage]") {
    CHECK(to_string(Status::successful) == "successful");
    CHECK(parse_status("paused") == Status::paused);
    CHECK(parse_status("PAUSED").error() == Errc::invalid_query_argument);

    StatusMask mask = Status::pending | Status::failed;
    CHECK(mask == 0x11);
    CHECK((mask | Status::running) == 0x13);
}

TEST_CASE("File status codes", "[stage]") {
    for (auto status : {FileStatus::incomplete, FileStatus::paused, FileStatus::success, FileStatus::failed}) {
        auto parsed = file_status_from_code(to_code(status));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == status);
    }
    CHECK(to_code(FileStatus::incomplete) == "INCOMPLETE");
    CHECK(file_status_from_code("incomplete").error() == Errc::malformed_record);
    CHECK(is_terminal(FileStatus::failed));
    CHECK_FALSE(is_terminal(FileStatus::paused));
}
