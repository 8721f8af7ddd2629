/// @file retry_policy.cpp
/// @brief RetryPolicy validation and delay arithmetic.

#include "lra/resilience/retry_policy.hpp"

#include <algorithm>

namespace lra::resilience {

using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::ErrorCode;

namespace {

AgentResult<RetryPolicy> invalid(const char* what) {
    return AgentResult<RetryPolicy>::err(
        AgentError(ErrorCode::InvalidArgument, std::string("invalid retry policy: ") + what));
}

} // namespace

AgentResult<RetryPolicy> RetryPolicy::create(RetryPolicyOptions options) {
    if (options.initialDelay <= std::chrono::milliseconds::zero()) {
        return invalid("initial_delay must be positive");
    }
    if (options.maxDelay < options.initialDelay) {
        return invalid("max_delay must be >= initial_delay");
    }
    // Negated comparisons also reject NaN.
    if (!(options.multiplier >= 1.0)) {
        return invalid("multiplier must be >= 1");
    }
    if (!(options.jitterFraction >= 0.0 && options.jitterFraction <= 1.0)) {
        return invalid("jitter must be between 0 and 1");
    }
    return AgentResult<RetryPolicy>::ok(RetryPolicy(options));
}

RetryPolicy RetryPolicy::defaults() {
    return RetryPolicy(RetryPolicyOptions{});
}

std::chrono::duration<double, std::milli> RetryPolicy::nextDelay(
    std::chrono::duration<double, std::milli> current) const noexcept {
    std::chrono::duration<double, std::milli> cap = options_.maxDelay;
    return std::min(cap, current * options_.multiplier);
}

std::chrono::duration<double, std::milli> RetryPolicy::jitteredDelay(
    std::chrono::duration<double, std::milli> base, double unitNoise) const noexcept {
    std::chrono::duration<double, std::milli> cap = options_.maxDelay;
    auto jitter = base * options_.jitterFraction * std::clamp(unitNoise, -1.0, 1.0);
    auto delay = std::min(cap, base + jitter);
    return std::max(delay, std::chrono::duration<double, std::milli>::zero());
}

}  // namespace lra::resilience
