#pragma once

/// @file guarded_inference.hpp
/// @brief Agent-side wrapper running each inference call through the
///        cache, rate limiter, retry loop and circuit breaker.

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lra/foundation/agent_result.hpp"
#include "lra/resilience/circuit_breaker.hpp"
#include "lra/resilience/response_cache.hpp"
#include "lra/resilience/retry_executor.hpp"
#include "lra/resilience/token_bucket_limiter.hpp"

namespace lra::agent {

/// One outbound inference call; returns the model reply or an error.
using InferenceOperation = std::function<lra::foundation::AgentResult<std::string>()>;

/// Per-call switches.
struct InferenceOptions {
    /// Consult and populate the response cache.
    bool useCache = true;

    /// Deadline for obtaining a rate-limit token; nullopt waits indefinitely.
    std::optional<std::chrono::milliseconds> acquireTimeout;
};

/// Health of a component or of the whole stack.
enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

[[nodiscard]] constexpr std::string_view toString(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/// Aggregated health; overall status is the worst component status.
struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::unordered_map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

/// Render a HealthCheckResult as a compact JSON object.
[[nodiscard]] std::string healthToJson(const HealthCheckResult& result);

/// Outcome counters for calls made through GuardedInference.
struct InferenceStats {
    uint64_t requests = 0;
    uint64_t cacheHits = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t rateLimited = 0;
    uint64_t circuitRejected = 0;
};

[[nodiscard]] std::string toString(const InferenceStats& stats);

/// Guards inference calls with the resilience components.
///
/// For each call: cache lookup, then a rate-limit token, then the retry
/// loop with every attempt dispatched through the circuit breaker, then a
/// cache store on success. The components are injected and must outlive
/// this object.
///
/// Example:
/// @code
///   GuardedInference guard(cache, *limiter, *breaker, retry);
///   auto reply = guard.complete(prompt, [&] { return backend.chat(prompt); });
///   std::cout << (reply ? reply.value() : GuardedInference::describe(reply.error()));
/// @endcode
class GuardedInference {
public:
    GuardedInference(lra::resilience::ResponseCache<std::string>& cache,
                     lra::resilience::TokenBucketLimiter& limiter,
                     lra::resilience::CircuitBreaker& breaker,
                     lra::resilience::RetryExecutor& retry);

    GuardedInference(const GuardedInference&) = delete;
    GuardedInference& operator=(const GuardedInference&) = delete;

    /// Run one inference call for `payload`.
    ///
    /// @return The reply, or the failure: the operation's own error
    ///         (permanent), RetryExhausted, CircuitOpen / CircuitHalfOpenLimit
    ///         or RateLimitTimeout.
    [[nodiscard]] lra::foundation::AgentResult<std::string> complete(
        std::string_view payload, const InferenceOperation& operation,
        const InferenceOptions& options = {});

    /// Text to show the end user for a failed call.
    [[nodiscard]] static std::string describe(const lra::foundation::AgentError& error);

    /// Breaker Open is Unhealthy, HalfOpen is Degraded. An enabled limiter
    /// with an empty bucket is Degraded.
    [[nodiscard]] HealthCheckResult healthSnapshot() const;

    [[nodiscard]] InferenceStats stats() const;
    void resetStats();

private:
    void recordFailure(const lra::foundation::AgentError& error);

    lra::resilience::ResponseCache<std::string>& cache_;
    lra::resilience::TokenBucketLimiter& limiter_;
    lra::resilience::CircuitBreaker& breaker_;
    lra::resilience::RetryExecutor& retry_;

    mutable std::mutex statsMutex_;
    InferenceStats stats_;
};

}  // namespace lra::agent
