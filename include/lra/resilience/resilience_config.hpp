#pragma once

/// @file resilience_config.hpp
/// @brief Aggregated settings for the retry, breaker, limiter and cache.

#include "lra/foundation/agent_result.hpp"
#include "lra/foundation/config_manager.hpp"
#include "lra/resilience/circuit_breaker.hpp"
#include "lra/resilience/response_cache.hpp"
#include "lra/resilience/retry_policy.hpp"
#include "lra/resilience/token_bucket_limiter.hpp"

namespace lra::resilience {

/// Default requests-per-minute budget when rate limiting is configured.
inline constexpr uint32_t kDefaultRequestsPerMinute = 60;

/// Every knob of the resilience layer, all defaulted.
struct ResilienceConfig {
    RetryPolicyOptions retry{};
    CircuitBreakerConfig circuitBreaker{};
    /// Disabled unless resilience.rate_limit.enabled is set.
    TokenBucketLimiterConfig rateLimit =
        TokenBucketLimiterConfig::fromRequestsPerMinute(kDefaultRequestsPerMinute, std::nullopt, false);
    ResponseCacheConfig cache{};
};

/// Read the `resilience.*` section of a loaded configuration.
///
/// Keys (all optional):
///   resilience.retry.{max_retries, initial_delay_ms, max_delay_ms, multiplier, jitter}
///   resilience.circuit_breaker.{threshold, reset_timeout_seconds, half_open_max_calls, name}
///   resilience.rate_limit.{enabled, requests_per_minute, burst_capacity}
///   resilience.cache.{enabled, max_entries, ttl_seconds}
///
/// @return ConfigTypeMismatch for a value of the wrong type,
///         ConfigInvalidValue for a negative count or duration, or the
///         RetryPolicy validation error for inconsistent retry settings.
[[nodiscard]] lra::foundation::AgentResult<ResilienceConfig> loadResilienceConfig(
    const lra::foundation::ConfigManager& config);

}  // namespace lra::resilience
