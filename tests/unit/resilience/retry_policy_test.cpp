#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>

#include "lra/resilience/retry_policy.hpp"

using namespace lra::resilience;
using namespace std::chrono_literals;
using lra::foundation::ErrorCode;
using Ms = std::chrono::duration<double, std::milli>;

TEST(RetryPolicyTest, DefaultsMatchDocumentedValues) {
    auto policy = RetryPolicy::defaults();
    EXPECT_EQ(policy.maxRetries(), 3u);
    EXPECT_EQ(policy.maxAttempts(), 4u);
    EXPECT_EQ(policy.initialDelay(), 1000ms);
    EXPECT_EQ(policy.maxDelay(), 30000ms);
    EXPECT_DOUBLE_EQ(policy.multiplier(), 2.0);
    EXPECT_DOUBLE_EQ(policy.jitterFraction(), 0.1);
}

TEST(RetryPolicyTest, CreateAcceptsValidOptions) {
    auto policy = RetryPolicy::create({.maxRetries = 0, .initialDelay = 1ms, .maxDelay = 1ms,
                                       .multiplier = 1.0, .jitterFraction = 1.0});
    ASSERT_TRUE(policy.hasValue());
    EXPECT_EQ(policy.value().maxAttempts(), 1u);
}

TEST(RetryPolicyTest, MaxAttemptsDoesNotWrap) {
    auto policy = RetryPolicy::create({.maxRetries = std::numeric_limits<uint32_t>::max()});
    ASSERT_TRUE(policy.hasValue());
    EXPECT_EQ(policy.value().maxAttempts(), uint64_t{4294967296});
}

TEST(RetryPolicyTest, CreateRejectsInvalidOptions) {
    RetryPolicyOptions zeroDelay;
    zeroDelay.initialDelay = 0ms;

    RetryPolicyOptions maxBelowInitial;
    maxBelowInitial.initialDelay = 500ms;
    maxBelowInitial.maxDelay = 100ms;

    RetryPolicyOptions shrinking;
    shrinking.multiplier = 0.5;

    RetryPolicyOptions nanMultiplier;
    nanMultiplier.multiplier = std::numeric_limits<double>::quiet_NaN();

    RetryPolicyOptions jitterTooLarge;
    jitterTooLarge.jitterFraction = 1.5;

    RetryPolicyOptions negativeJitter;
    negativeJitter.jitterFraction = -0.1;

    for (const auto& options :
         {zeroDelay, maxBelowInitial, shrinking, nanMultiplier, jitterTooLarge, negativeJitter}) {
        auto policy = RetryPolicy::create(options);
        ASSERT_TRUE(policy.hasError());
        EXPECT_EQ(policy.error().code(), ErrorCode::InvalidArgument);
    }
}

TEST(RetryPolicyTest, BackoffSequenceIsNonDecreasingAndCapped) {
    auto policy = RetryPolicy::create({.maxRetries = 10, .initialDelay = 100ms,
                                       .maxDelay = 1000ms, .multiplier = 3.0,
                                       .jitterFraction = 0.0}).value();

    Ms delay = policy.initialDelay();
    Ms previous{0};
    for (int i = 0; i < 10; ++i) {
        EXPECT_GE(delay, previous);
        EXPECT_LE(delay, Ms(policy.maxDelay()));
        previous = delay;
        delay = policy.nextDelay(delay);
    }
    EXPECT_DOUBLE_EQ(delay.count(), 1000.0);
}

TEST(RetryPolicyTest, HugeMultiplierNeverExceedsMaxDelay) {
    auto policy = RetryPolicy::create({.initialDelay = 10ms, .maxDelay = 50ms,
                                       .multiplier = 1e12}).value();
    EXPECT_DOUBLE_EQ(policy.nextDelay(Ms(10)).count(), 50.0);
}

TEST(RetryPolicyTest, JitterStaysWithinFraction) {
    auto policy = RetryPolicy::create({.initialDelay = 100ms, .maxDelay = 10000ms,
                                       .jitterFraction = 0.2}).value();
    EXPECT_DOUBLE_EQ(policy.jitteredDelay(Ms(1000), 1.0).count(), 1200.0);
    EXPECT_DOUBLE_EQ(policy.jitteredDelay(Ms(1000), -1.0).count(), 800.0);
    EXPECT_DOUBLE_EQ(policy.jitteredDelay(Ms(1000), 0.0).count(), 1000.0);
}

TEST(RetryPolicyTest, JitterIsCappedAndNonNegative) {
    auto policy = RetryPolicy::create({.initialDelay = 100ms, .maxDelay = 1000ms,
                                       .jitterFraction = 1.0}).value();
    EXPECT_DOUBLE_EQ(policy.jitteredDelay(Ms(1000), 1.0).count(), 1000.0);
    EXPECT_DOUBLE_EQ(policy.jitteredDelay(Ms(500), -1.0).count(), 0.0);
    // Out-of-range noise is clamped to [-1, 1].
    EXPECT_DOUBLE_EQ(policy.jitteredDelay(Ms(500), -7.0).count(), 0.0);
}
