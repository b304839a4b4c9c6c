// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <grab/core/config.hpp>
#include <grab/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <system_error>
#include <thread>
#include <type_traits>

namespace grab::core {

// Run op(attempt) until it succeeds or the policy is exhausted.
// op returns std::expected<T, std::error_code>; attempts are 1-based.
// on_failure(attempt, ec) is called after every failed attempt.
// Disk errors are returned at once without retrying.
template<typename Op, typename OnFailure>
auto with_retry(const RetryPolicy& policy, Op&& op, OnFailure&& on_failure)
    -> std::invoke_result_t<Op&, std::uint32_t> {
    const std::uint32_t attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (std::uint32_t attempt = 1;; ++attempt) {
        auto result = op(attempt);
        if (result) {
            return result;
        }

        on_failure(attempt, result.error());

        if (attempt >= attempts || disk::is_disk_error(result.error())) {
            return result;
        }

        if (policy.delay.count() > 0) {
            std::this_thread::sleep_for(policy.delay);
        }
    }
}

} // namespace grab::core
