#include "lsink/pool/retry-policy.h"
#include "lsink/common/errors.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace lsink::pool {

namespace {

constexpr std::array<std::string_view, 14> transient_patterns = {
    "resource busy",
    "disk full",
    "no space left",
    "enospc",
    "emfile",
    "enfile",
    "too many open files",
    "eagain",
    "resource temporarily unavailable",
    "ebusy",
    "device busy",
    "timeout",
    "timed out",
    "worker crashed"};

}  // namespace

bool
is_transient_message(std::string_view message)
{
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    return std::any_of(
        transient_patterns.begin(),
        transient_patterns.end(),
        [&](std::string_view pattern) {
            return lower.find(pattern) != std::string::npos;
        });
}

bool
is_transient(const std::exception& e)
{
    if (dynamic_cast<const TransientError*>(&e) != nullptr)
        return true;
    return is_transient_message(e.what());
}

std::chrono::milliseconds
RetryPolicy::backoff(int failed_attempts, std::mt19937& rng) const
{
    int exponent = std::clamp(failed_attempts - 1, 0, 30);
    auto scaled = base_delay.count() * (int64_t{1} << exponent);
    auto capped = std::min<int64_t>(scaled, max_delay.count());

    int64_t extra = 0;
    if (jitter.count() > 0)
    {
        std::uniform_int_distribution<int64_t> dist(0, jitter.count());
        extra = dist(rng);
    }
    return std::chrono::milliseconds(capped + extra);
}

}  // namespace lsink::pool
