#pragma once

#include <chrono>
#include <exception>
#include <random>
#include <string_view>

namespace lsink::pool {

/**
 * True when the message matches a transient failure pattern (resource busy,
 * disk full, ENOSPC, EMFILE, EAGAIN, timeouts, worker crashes...).
 * Matching is case-insensitive.
 */
bool
is_transient_message(std::string_view message);

/**
 * TransientError subclasses are always transient; anything else is
 * transient when its message matches.
 */
bool
is_transient(const std::exception& e);

struct RetryPolicy
{
    /** Total attempts including the first */
    int max_attempts = 3;

    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};
    std::chrono::milliseconds jitter{500};

    /**
     * Delay before the next attempt after `failed_attempts` failures:
     * min(base * 2^(failed_attempts - 1), max) + uniform(0, jitter)
     */
    std::chrono::milliseconds
    backoff(int failed_attempts, std::mt19937& rng) const;
};

}  // namespace lsink::pool
