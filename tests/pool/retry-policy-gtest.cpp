#include "lsink/common/errors.h"
#include "lsink/pool/retry-policy.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace lsink;
using namespace lsink::pool;

TEST(TransientClassifier, MatchesKnownPatternsCaseInsensitively)
{
    EXPECT_TRUE(is_transient_message("EBUSY: resource busy or locked"));
    EXPECT_TRUE(is_transient_message("write failed: No space left on device"));
    EXPECT_TRUE(is_transient_message("ENOSPC"));
    EXPECT_TRUE(is_transient_message("EMFILE: too many open files"));
    EXPECT_TRUE(is_transient_message("Resource temporarily unavailable"));
    EXPECT_TRUE(is_transient_message("operation Timed Out"));
    EXPECT_TRUE(is_transient_message("connect timeout"));
    EXPECT_TRUE(is_transient_message("Worker crashed while running job"));
    EXPECT_TRUE(is_transient_message("disk full"));
}

TEST(TransientClassifier, RejectsOtherMessages)
{
    EXPECT_FALSE(is_transient_message("Permission denied"));
    EXPECT_FALSE(is_transient_message("Invalid record kind"));
    EXPECT_FALSE(is_transient_message(""));
}

TEST(TransientClassifier, TransientErrorTypesAlwaysRetry)
{
    EXPECT_TRUE(is_transient(TransientError("anything")));
    EXPECT_TRUE(is_transient(WorkerCrashedError("boom")));
    EXPECT_FALSE(is_transient(InvalidJobError("contracts cannot be encoded")));
    EXPECT_TRUE(is_transient(EncoderIoError("open failed: EMFILE")));
    EXPECT_FALSE(is_transient(std::runtime_error("bad data")));
}

TEST(RetryPolicy, BackoffDoublesAndCaps)
{
    RetryPolicy policy;
    policy.jitter = std::chrono::milliseconds(0);
    std::mt19937 rng(7);

    EXPECT_EQ(policy.backoff(1, rng).count(), 1000);
    EXPECT_EQ(policy.backoff(2, rng).count(), 2000);
    EXPECT_EQ(policy.backoff(3, rng).count(), 4000);
    EXPECT_EQ(policy.backoff(4, rng).count(), 8000);
    EXPECT_EQ(policy.backoff(5, rng).count(), 10000);
    EXPECT_EQ(policy.backoff(40, rng).count(), 10000);
}

TEST(RetryPolicy, JitterStaysWithinBounds)
{
    RetryPolicy policy;
    std::mt19937 rng(11);
    for (int i = 0; i < 100; ++i)
    {
        auto delay = policy.backoff(1, rng).count();
        EXPECT_GE(delay, 1000);
        EXPECT_LE(delay, 1500);
    }
}
