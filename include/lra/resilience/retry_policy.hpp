#pragma once

/// @file retry_policy.hpp
/// @brief Immutable exponential-backoff retry policy.

#include <chrono>
#include <cstdint>

#include "lra/foundation/agent_result.hpp"

namespace lra::resilience {

/// Raw policy parameters, validated by RetryPolicy::create().
struct RetryPolicyOptions {
    /// Retries after the first attempt; total attempts = maxRetries + 1.
    uint32_t maxRetries = 3;

    /// Delay before the first retry. Must be positive.
    std::chrono::milliseconds initialDelay{1000};

    /// Upper bound for any single delay. Must be >= initialDelay.
    std::chrono::milliseconds maxDelay{30000};

    /// Growth factor applied after every retry. Must be >= 1.
    double multiplier = 2.0;

    /// Jitter as a fraction of the current delay, in [0, 1].
    double jitterFraction = 0.1;
};

/// Validated, immutable retry policy.
///
/// Example:
/// @code
///   auto policy = RetryPolicy::create({.maxRetries = 2,
///                                      .initialDelay = std::chrono::milliseconds(50),
///                                      .jitterFraction = 0.0});
///   if (!policy) { return policy.error(); }
/// @endcode
class RetryPolicy {
public:
    /// Validate options and build a policy.
    /// @return InvalidArgument if any parameter is out of range.
    [[nodiscard]] static lra::foundation::AgentResult<RetryPolicy> create(
        RetryPolicyOptions options = {});

    /// Policy with the documented defaults (3 retries, 1s..30s, x2, 10% jitter).
    [[nodiscard]] static RetryPolicy defaults();

    [[nodiscard]] uint32_t maxRetries() const noexcept { return options_.maxRetries; }
    /// Widened so maxRetries = UINT32_MAX does not wrap to zero.
    [[nodiscard]] uint64_t maxAttempts() const noexcept {
        return static_cast<uint64_t>(options_.maxRetries) + 1;
    }
    [[nodiscard]] std::chrono::milliseconds initialDelay() const noexcept {
        return options_.initialDelay;
    }
    [[nodiscard]] std::chrono::milliseconds maxDelay() const noexcept {
        return options_.maxDelay;
    }
    [[nodiscard]] double multiplier() const noexcept { return options_.multiplier; }
    [[nodiscard]] double jitterFraction() const noexcept { return options_.jitterFraction; }

    /// Base delay before the next attempt: min(maxDelay, current * multiplier).
    [[nodiscard]] std::chrono::duration<double, std::milli> nextDelay(
        std::chrono::duration<double, std::milli> current) const noexcept;

    /// Apply jitter to a base delay.
    ///
    /// @param unitNoise Value in [-1, 1]; the jitter added is
    ///        base * jitterFraction * unitNoise.
    /// @return min(maxDelay, base + jitter), never negative.
    [[nodiscard]] std::chrono::duration<double, std::milli> jitteredDelay(
        std::chrono::duration<double, std::milli> base, double unitNoise) const noexcept;

private:
    explicit RetryPolicy(RetryPolicyOptions options) : options_(options) {}

    RetryPolicyOptions options_;
};

}  // namespace lra::resilience
