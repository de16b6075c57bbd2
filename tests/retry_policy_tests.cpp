// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <parcel/core/retry_policy.hpp>

using namespace parcel::core;

namespace {

constexpr Connectivity ONLINE{true, true};
constexpr Connectivity METERED{true, false};
constexpr Connectivity OFFLINE{false, false};

} // namespace

TEST_CASE("Waiting for network follows connectivity", "[retry]") {
    RetryPolicy policy;
    const Stage stage(StageCode::waiting_for_network);

    CHECK(policy.decide(stage, {}, OFFLINE) == RetryDecision::wait_for_network);
    CHECK(policy.decide(stage, {}, ONLINE) == RetryDecision::retry_now);
    CHECK(policy.decide(stage, {}, METERED) == RetryDecision::retry_now);
    CHECK(policy.decide(stage, {0, true}, METERED) == RetryDecision::wait_for_wifi);
}

TEST_CASE("Queued for wifi needs an unmetered network", "[retry]") {
    RetryPolicy policy;
    const Stage stage(StageCode::queued_for_wifi);

    CHECK(policy.decide(stage, {}, OFFLINE) == RetryDecision::wait_for_network);
    CHECK(policy.decide(stage, {}, METERED) == RetryDecision::wait_for_wifi);
    CHECK(policy.decide(stage, {}, ONLINE) == RetryDecision::retry_now);
}

TEST_CASE("Waiting to retry respects the attempt limit", "[retry]") {
    RetryPolicy policy(3);
    const Stage stage(StageCode::waiting_to_retry);

    CHECK(policy.decide(stage, {0, false}, ONLINE) == RetryDecision::retry_now);
    CHECK(policy.decide(stage, {2, false}, ONLINE) == RetryDecision::retry_now);
    CHECK(policy.decide(stage, {2, false}, OFFLINE) == RetryDecision::wait_for_network);
    CHECK(policy.decide(stage, {3, false}, ONLINE) == RetryDecision::give_up);
    CHECK(policy.decide(stage, {3, false}, OFFLINE) == RetryDecision::give_up);
}

TEST_CASE("Other stages need no scheduling", "[retry]") {
    RetryPolicy policy;

    CHECK(policy.decide(Stage(StageCode::queued), {}, ONLINE) == RetryDecision::none);
    CHECK(policy.decide(Stage(StageCode::running), {}, ONLINE) == RetryDecision::none);
    CHECK(policy.decide(Stage(StageCode::paused_by_app), {}, ONLINE) == RetryDecision::none);
    CHECK(policy.decide(Stage(StageCode::success), {}, ONLINE) == RetryDecision::none);
    CHECK(policy.decide(Stage(StageCode::http_data_error), {}, ONLINE) == RetryDecision::give_up);
    CHECK(policy.decide(*Stage::from_code(503), {}, ONLINE) == RetryDecision::give_up);
}

TEST_CASE("classify_failure", "[retry]") {
    RetryPolicy policy(2);

    SECTION("Connectivity comes first") {
        CHECK(policy.classify_failure(495, {}, OFFLINE) == Stage(StageCode::waiting_for_network));
        CHECK(policy.classify_failure(495, {0, true}, METERED) == Stage(StageCode::queued_for_wifi));
    }

    SECTION("Transient failures retry until the limit") {
        CHECK(policy.classify_failure(495, {0, false}, ONLINE) == Stage(StageCode::waiting_to_retry));
        CHECK(policy.classify_failure(503, {1, false}, ONLINE) == Stage(StageCode::waiting_to_retry));
        CHECK(policy.classify_failure(503, {2, false}, ONLINE).code() == 503);
        CHECK(policy.classify_failure(496, {2, false}, ONLINE) == Stage(StageCode::http_exception));
    }

    SECTION("Permanent failures keep their code while offline") {
        CHECK(policy.classify_failure(498, {}, OFFLINE) == Stage(StageCode::insufficient_space));
        CHECK(policy.classify_failure(492, {0, true}, METERED) == Stage(StageCode::file_error));
        CHECK(policy.decide(policy.classify_failure(498, {}, OFFLINE), {}, ONLINE) == RetryDecision::give_up);
    }

    SECTION("Exhausted transient failures are not suspended by connectivity") {
        CHECK(policy.classify_failure(495, {2, false}, OFFLINE) == Stage(StageCode::http_data_error));
    }

    SECTION("Permanent failures keep their code") {
        CHECK(policy.classify_failure(498, {}, ONLINE) == Stage(StageCode::insufficient_space));
        CHECK(policy.classify_failure(404, {}, ONLINE).code() == 404);
        CHECK(policy.classify_failure(404, {}, ONLINE).category() == Status::failed);
    }

    SECTION("Codes outside the failure range become UNKNOWN_ERROR") {
        CHECK(policy.classify_failure(200, {}, ONLINE) == Stage(StageCode::unknown_error));
        CHECK(policy.classify_failure(-1, {}, ONLINE) == Stage(StageCode::unknown_error));
    }
}

TEST_CASE("Retryable codes", "[retry]") {
    CHECK(RetryPolicy::is_retryable(495));
    CHECK(RetryPolicy::is_retryable(496));
    CHECK(RetryPolicy::is_retryable(500));
    CHECK(RetryPolicy::is_retryable(599));
    CHECK_FALSE(RetryPolicy::is_retryable(404));
    CHECK_FALSE(RetryPolicy::is_retryable(498));
    CHECK_FALSE(RetryPolicy::is_retryable(600));
}

TEST_CASE("RetryDecision names", "[retry]") {
    CHECK(to_string(RetryDecision::retry_now) == "retry-now");
    CHECK(to_string(RetryDecision::give_up) == "give-up");
    CHECK(to_string(RetryDecision::none) == "none");
}
