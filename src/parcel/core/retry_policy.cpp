// Copyright (c) 2026 changcheng967. All rights reserved.

#include <parcel/core/retry_policy.hpp>

namespace parcel::core {

std::string_view to_string(RetryDecision decision) noexcept {
    switch (decision) {
        case RetryDecision::none:             return "none";
        case RetryDecision::retry_now:        return "retry-now";
        case RetryDecision::wait_for_network: return "wait-for-network";
        case RetryDecision::wait_for_wifi:    return "wait-for-wifi";
        case RetryDecision::give_up:          return "give-up";
    }
    return "none";
}

bool RetryPolicy::is_retryable(int failure_code) noexcept {
    switch (static_cast<StageCode>(failure_code)) {
        case StageCode::http_data_error:
        case StageCode::http_exception:
            return true;
        default:
            break;
    }
    return failure_code >= 500 && failure_code < 600;
}

RetryDecision RetryPolicy::decide(Stage stage, const AttemptState& attempt,
                                  const Connectivity& connectivity) const noexcept {
    auto connectivity_gate = [&]() {
        if (!connectivity.network_available) {
            return RetryDecision::wait_for_network;
        }
        if (attempt.requires_unmetered && !connectivity.unmetered_available) {
            return RetryDecision::wait_for_wifi;
        }
        return RetryDecision::retry_now;
    };

    switch (static_cast<StageCode>(stage.code())) {
        case StageCode::waiting_for_network:
            return connectivity_gate();

        case StageCode::queued_for_wifi:
            if (!connectivity.network_available) {
                return RetryDecision::wait_for_network;
            }
            return connectivity.unmetered_available ? RetryDecision::retry_now : RetryDecision::wait_for_wifi;

        case StageCode::waiting_to_retry:
            if (attempt.attempts >= max_attempts_) {
                return RetryDecision::give_up;
            }
            return connectivity_gate();

        default:
            break;
    }

    // Failures are terminal; only an explicit requeue brings them back
    if (stage.is_failure()) {
        return RetryDecision::give_up;
    }
    return RetryDecision::none;
}

Stage RetryPolicy::classify_failure(int failure_code, const AttemptState& attempt,
                                    const Connectivity& connectivity) const noexcept {
    // Connectivity only explains transient failures that still have attempts
    // left; anything else keeps its failure code
    if (is_retryable(failure_code) && attempt.attempts < max_attempts_) {
        if (!connectivity.network_available) {
            return Stage(StageCode::waiting_for_network);
        }
        if (attempt.requires_unmetered && !connectivity.unmetered_available) {
            return Stage(StageCode::queued_for_wifi);
        }
        return Stage(StageCode::waiting_to_retry);
    }
    if (is_failure_code(failure_code)) {
        if (auto stage = Stage::from_code(failure_code)) {
            return *stage;
        }
    }
    return Stage(StageCode::unknown_error);
}

} // namespace parcel::core
