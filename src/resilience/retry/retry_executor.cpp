/// @file retry_executor.cpp
/// @brief RetryExecutor bookkeeping, classification and backoff computation.

#include "lra/resilience/retry_executor.hpp"

#include <algorithm>
#include <random>
#include <sstream>
#include <thread>

#include "lra/foundation/agent_logger.hpp"

namespace lra::resilience {

using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::LogCategory;
using lra::foundation::LogContext;
using lra::foundation::LogLevel;

namespace {

double uniformNoise() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return dist(engine);
}

void blockingSleep(DelayMs delay) {
    std::this_thread::sleep_for(
        std::chrono::duration_cast<std::chrono::microseconds>(delay));
}

} // namespace

RetryExecutor::RetryExecutor(RetryPolicy policy, RetryClassifier classify,
                             CircuitBreaker* breaker)
    : policy_(std::move(policy)),
      classify_(classify ? std::move(classify) : RetryClassifier(isRetriable)),
      breaker_(breaker),
      sleeper_(blockingSleep),
      noise_(uniformNoise) {}

void RetryExecutor::setRetryObserver(RetryObserver observer) {
    observer_ = std::move(observer);
}

void RetryExecutor::setSleeper(RetrySleeper sleeper) {
    sleeper_ = sleeper ? std::move(sleeper) : RetrySleeper(blockingSleep);
}

void RetryExecutor::setNoiseSource(NoiseSource noise) {
    noise_ = noise ? std::move(noise) : NoiseSource(uniformNoise);
}

AgentResult<DelayMs> RetryExecutor::onAttemptFailed(const AgentError& error,
                                                    uint32_t attempt,
                                                    DelayMs baseDelay) {
    {
        std::lock_guard lock(statsMutex_);
        ++stats_.failedAttempts;
    }

    // Breaker rejections never reach the operation, so retrying them
    // would only burn the policy; they go straight back to the caller.
    auto kind = classifyFailure(error);
    bool retriable = kind != FailureKind::CircuitOpen &&
                     kind != FailureKind::RateLimitTimeout &&
                     classify_(error);

    if (!retriable) {
        LRA_LOG_CTX(LogLevel::Warning, LogCategory::Retry, "retry_non_retriable_error",
                    LogContext{}
                        .add("error", error.message())
                        .add("subsystem", error.subsystem())
                        .add("attempt", attempt));
        {
            std::lock_guard lock(statsMutex_);
            ++stats_.failedAfterRetries;
        }
        return AgentResult<DelayMs>::err(error);
    }

    if (static_cast<uint64_t>(attempt) >= policy_.maxAttempts()) {
        LRA_LOG_CTX(LogLevel::Error, LogCategory::Retry, "retry_exhausted",
                    LogContext{}.add("attempts", attempt).add("error", error.message()));
        {
            std::lock_guard lock(statsMutex_);
            ++stats_.failedAfterRetries;
        }
        return AgentResult<DelayMs>::err(makeRetryExhausted(attempt, error));
    }

    DelayMs actual = policy_.jitteredDelay(baseDelay, noise_());
    {
        std::lock_guard lock(statsMutex_);
        ++stats_.retries;
        stats_.totalDelayMs += actual.count();
        stats_.maxDelayMs = std::max(stats_.maxDelayMs, actual.count());
    }

    LRA_LOG_CTX(LogLevel::Info, LogCategory::Retry, "retry_attempt",
                LogContext{}
                    .add("attempt", attempt)
                    .add("max_retries", policy_.maxRetries())
                    .add("delay_ms", actual.count())
                    .add("error", error.message()));

    if (observer_) {
        observer_(RetryOutcome{attempt, error, actual});
    }
    return AgentResult<DelayMs>::ok(actual);
}

void RetryExecutor::onAttemptSucceeded(uint32_t attempt) {
    if (attempt > 1) {
        std::lock_guard lock(statsMutex_);
        ++stats_.successfulRetries;
    }
}

RetryStats RetryExecutor::stats() const {
    std::lock_guard lock(statsMutex_);
    return stats_;
}

void RetryExecutor::resetStats() {
    std::lock_guard lock(statsMutex_);
    stats_ = RetryStats{};
}

std::string toString(const RetryStats& stats) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << "failed_attempts=" << stats.failedAttempts
        << " retries=" << stats.retries
        << " successful_retries=" << stats.successfulRetries
        << " failed_after_retries=" << stats.failedAfterRetries
        << " success_rate=" << stats.successRate() << '%'
        << " avg_delay_ms=" << stats.avgDelayMs()
        << " max_delay_ms=" << stats.maxDelayMs;
    return oss.str();
}

}  // namespace lra::resilience
