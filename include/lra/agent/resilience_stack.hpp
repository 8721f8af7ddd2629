#pragma once

/// @file resilience_stack.hpp
/// @brief Owns one instance of every resilience component for a process.

#include <memory>
#include <string>

#include "lra/agent/guarded_inference.hpp"
#include "lra/foundation/agent_result.hpp"
#include "lra/resilience/resilience_config.hpp"

namespace lra::agent {

/// Cache, limiter, breaker and retry executor built from one
/// ResilienceConfig, plus the GuardedInference wired to them.
///
/// The stack is created explicitly and handed to whoever needs it; there is
/// no process-wide instance. Members are declared before `inference_` so
/// they outlive it.
class ResilienceStack {
public:
    /// Validate the configuration and build every component.
    /// @return The first component validation error.
    [[nodiscard]] static lra::foundation::AgentResult<std::unique_ptr<ResilienceStack>> create(
        const lra::resilience::ResilienceConfig& config);

    ResilienceStack(const ResilienceStack&) = delete;
    ResilienceStack& operator=(const ResilienceStack&) = delete;

    [[nodiscard]] GuardedInference& inference() noexcept { return *inference_; }
    [[nodiscard]] lra::resilience::ResponseCache<std::string>& cache() noexcept { return *cache_; }
    [[nodiscard]] lra::resilience::TokenBucketLimiter& limiter() noexcept { return *limiter_; }
    [[nodiscard]] lra::resilience::CircuitBreaker& breaker() noexcept { return *breaker_; }
    [[nodiscard]] lra::resilience::RetryExecutor& retry() noexcept { return *retry_; }

    /// Multi-line report of every component's counters.
    [[nodiscard]] std::string statsReport() const;

    /// Reset every component's counters (entries and breaker state are kept).
    void resetStats();

private:
    ResilienceStack() = default;

    std::unique_ptr<lra::resilience::ResponseCache<std::string>> cache_;
    std::unique_ptr<lra::resilience::TokenBucketLimiter> limiter_;
    std::unique_ptr<lra::resilience::CircuitBreaker> breaker_;
    std::unique_ptr<lra::resilience::RetryExecutor> retry_;
    std::unique_ptr<GuardedInference> inference_;
};

}  // namespace lra::agent
