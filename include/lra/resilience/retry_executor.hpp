#pragma once

/// @file retry_executor.hpp
/// @brief Bounded retry loop with exponential backoff, jitter and
///        error classification, optionally dispatching through a breaker.

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

#include "lra/foundation/agent_result.hpp"
#include "lra/resilience/circuit_breaker.hpp"
#include "lra/resilience/failure.hpp"
#include "lra/resilience/retry_policy.hpp"

namespace lra::resilience {

using DelayMs = std::chrono::duration<double, std::milli>;

/// Details of one failed attempt that is about to be retried.
struct RetryOutcome {
    uint32_t attempt = 0;                 ///< 1-based number of the failed attempt.
    lra::foundation::AgentError error;    ///< Error returned by that attempt.
    DelayMs delay{0};                     ///< Sleep before the next attempt.
};

/// Observer notified before every backoff sleep. Observability only.
using RetryObserver = std::function<void(const RetryOutcome&)>;

/// Suspends the calling thread; replaceable so tests can record delays.
using RetrySleeper = std::function<void(DelayMs)>;

/// Returns uniform noise in [-1, 1] used for jitter.
using NoiseSource = std::function<double()>;

/// Cumulative retry counters.
struct RetryStats {
    uint64_t failedAttempts = 0;      ///< Attempts that returned an error.
    uint64_t retries = 0;             ///< Backoff sleeps scheduled.
    uint64_t successfulRetries = 0;   ///< Calls that succeeded after >= 1 retry.
    uint64_t failedAfterRetries = 0;  ///< Calls that gave up (exhausted or permanent).
    double totalDelayMs = 0.0;
    double maxDelayMs = 0.0;

    [[nodiscard]] double avgDelayMs() const noexcept {
        return retries > 0 ? totalDelayMs / static_cast<double>(retries) : 0.0;
    }

    /// Percentage of failed attempts that were eventually recovered.
    [[nodiscard]] double successRate() const noexcept {
        return failedAttempts > 0
            ? static_cast<double>(successfulRetries) / static_cast<double>(failedAttempts) * 100.0
            : 0.0;
    }
};

[[nodiscard]] std::string toString(const RetryStats& stats);

/// Runs operations under a RetryPolicy.
///
/// Each attempt goes through the configured CircuitBreaker when one is set.
/// Non-retriable errors and breaker rejections propagate unchanged after a
/// single attempt; retriable errors are retried until the policy is spent
/// and then surface as ErrorCode::RetryExhausted wrapping the last error.
///
/// Example:
/// @code
///   RetryExecutor retry(RetryPolicy::defaults(), isRetriable, breaker.get());
///   auto reply = retry.run([&] { return backend.complete(prompt); });
/// @endcode
///
/// Thread-safe: concurrent run() calls only share the stats, which are
/// mutex-protected. Cancellation is only possible between attempts.
class RetryExecutor {
public:
    explicit RetryExecutor(RetryPolicy policy,
                           RetryClassifier classify = isRetriable,
                           CircuitBreaker* breaker = nullptr);

    /// Observer called before each backoff sleep.
    void setRetryObserver(RetryObserver observer);

    /// Replace the blocking sleep (defaults to std::this_thread::sleep_for).
    void setSleeper(RetrySleeper sleeper);

    /// Replace the jitter noise source (defaults to a uniform PRNG).
    void setNoiseSource(NoiseSource noise);

    /// Run an operation returning AgentResult<T> with retries.
    template <typename Operation>
    auto run(Operation&& operation) -> std::invoke_result_t<Operation&>;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] CircuitBreaker* breaker() const noexcept { return breaker_; }

    [[nodiscard]] RetryStats stats() const;
    void resetStats();

private:
    /// Book a failed attempt. Returns the delay before the next attempt, or
    /// the error to hand back to the caller when giving up.
    lra::foundation::AgentResult<DelayMs> onAttemptFailed(
        const lra::foundation::AgentError& error, uint32_t attempt, DelayMs baseDelay);

    void onAttemptSucceeded(uint32_t attempt);

    RetryPolicy policy_;
    RetryClassifier classify_;
    CircuitBreaker* breaker_;
    RetryObserver observer_;
    RetrySleeper sleeper_;
    NoiseSource noise_;

    mutable std::mutex statsMutex_;
    RetryStats stats_;
};

// --- Template implementation ---

template <typename Operation>
auto RetryExecutor::run(Operation&& operation) -> std::invoke_result_t<Operation&> {
    using R = std::invoke_result_t<Operation&>;
    static_assert(std::is_same_v<typename R::error_type, lra::foundation::AgentError>,
                  "RetryExecutor::run requires an operation returning AgentResult<T>");

    DelayMs delay = policy_.initialDelay();
    for (uint32_t attempt = 1;; ++attempt) {
        R result = breaker_ != nullptr ? breaker_->call(operation) : std::invoke(operation);
        if (result.hasValue()) {
            onAttemptSucceeded(attempt);
            return result;
        }

        auto next = onAttemptFailed(result.error(), attempt, delay);
        if (!next) {
            return R::err(std::move(next).error());
        }

        // Sleep happens with no lock held.
        sleeper_(next.value());
        delay = policy_.nextDelay(delay);
    }
}

/// Run an operation once under a policy without keeping an executor around.
template <typename Operation>
auto runWithRetry(Operation&& operation, const RetryPolicy& policy,
                  RetryClassifier classify = isRetriable,
                  CircuitBreaker* breaker = nullptr,
                  RetryObserver onRetry = {}) -> std::invoke_result_t<Operation&> {
    RetryExecutor executor(policy, std::move(classify), breaker);
    if (onRetry) {
        executor.setRetryObserver(std::move(onRetry));
    }
    return executor.run(operation);
}

}  // namespace lra::resilience
