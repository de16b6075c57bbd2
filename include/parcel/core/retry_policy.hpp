// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <parcel/core/config.hpp>
#include <parcel/core/stage.hpp>
#include <cstdint>
#include <string_view>

namespace parcel::core {

enum class RetryDecision : std::uint8_t {
    none,              // nothing to schedule: active, paused by the app, or finished
    retry_now,
    wait_for_network,
    wait_for_wifi,
    give_up,
};

[[nodiscard]] std::string_view to_string(RetryDecision decision) noexcept;

struct Connectivity {
    bool network_available{true};
    bool unmetered_available{true};
};

// Kept by the scheduler, not by the store
struct AttemptState {
    std::uint32_t attempts{0};
    bool requires_unmetered{false};
};

// Classifies suspended and failed downloads. The backoff curve belongs to
// the scheduler that calls this.
class RetryPolicy {
public:
    explicit RetryPolicy(std::uint32_t max_attempts = DEFAULT_MAX_RETRY_ATTEMPTS) noexcept
        : max_attempts_(max_attempts) {}

    [[nodiscard]] RetryDecision decide(Stage stage, const AttemptState& attempt,
                                       const Connectivity& connectivity) const noexcept;

    // Stage to persist after a transfer failed with the given failure code.
    // Only a retryable code under the attempt limit is suspended; the
    // connectivity decides which waiting stage.
    [[nodiscard]] Stage classify_failure(int failure_code, const AttemptState& attempt,
                                         const Connectivity& connectivity) const noexcept;

    // Transient transport failures and server-side (5xx) errors
    [[nodiscard]] static bool is_retryable(int failure_code) noexcept;

    [[nodiscard]] std::uint32_t max_attempts() const noexcept { return max_attempts_; }

private:
    std::uint32_t max_attempts_;
};

} // namespace parcel::core
