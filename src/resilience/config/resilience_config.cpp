/// @file resilience_config.cpp
/// @brief loadResilienceConfig implementation.

#include "lra/resilience/resilience_config.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "lra/foundation/agent_logger.hpp"

namespace lra::resilience {

using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::ConfigManager;
using lra::foundation::ErrorCode;
using lra::foundation::LogCategory;
using lra::foundation::LogContext;
using lra::foundation::LogLevel;

namespace {

/// Overwrite `out` when the key is present; absent keys keep the default.
template <typename T>
AgentResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return AgentResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return AgentResult<void>::err(std::move(value).error());
    }
    out = std::move(value).value();
    return AgentResult<void>::ok();
}

/// Integer setting in [0, maxValue].
AgentResult<void> readCount(const ConfigManager& config, std::string_view key,
                            int64_t maxValue, int64_t& out) {
    if (auto r = readOptional(config, key, out); !r) {
        return r;
    }
    if (out < 0) {
        return AgentResult<void>::err(AgentError(
            ErrorCode::ConfigInvalidValue,
            std::string("config value must not be negative: ") + std::string(key)));
    }
    if (out > maxValue) {
        return AgentResult<void>::err(AgentError(
            ErrorCode::ConfigInvalidValue,
            std::string("config value out of range: ") + std::string(key) +
                " (max " + std::to_string(maxValue) + ")"));
    }
    return AgentResult<void>::ok();
}

constexpr int64_t kMaxUint32 = std::numeric_limits<uint32_t>::max();

// Durations are stored as milliseconds; seconds keys must not overflow them.
constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max() / 1000;

AgentResult<void> readRetry(const ConfigManager& config, RetryPolicyOptions& retry) {
    int64_t maxRetries = retry.maxRetries;
    int64_t initialDelayMs = retry.initialDelay.count();
    int64_t maxDelayMs = retry.maxDelay.count();

    if (auto r = readCount(config, "resilience.retry.max_retries", kMaxUint32, maxRetries); !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.retry.initial_delay_ms",
                           std::numeric_limits<int64_t>::max(), initialDelayMs); !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.retry.max_delay_ms",
                           std::numeric_limits<int64_t>::max(), maxDelayMs); !r) {
        return r;
    }
    if (auto r = readOptional(config, "resilience.retry.multiplier", retry.multiplier); !r) {
        return r;
    }
    if (auto r = readOptional(config, "resilience.retry.jitter", retry.jitterFraction); !r) {
        return r;
    }

    retry.maxRetries = static_cast<uint32_t>(maxRetries);
    retry.initialDelay = std::chrono::milliseconds(initialDelayMs);
    retry.maxDelay = std::chrono::milliseconds(maxDelayMs);

    if (auto policy = RetryPolicy::create(retry); !policy) {
        return AgentResult<void>::err(std::move(policy).error());
    }
    return AgentResult<void>::ok();
}

AgentResult<void> readCircuitBreaker(const ConfigManager& config, CircuitBreakerConfig& breaker) {
    int64_t threshold = breaker.failureThreshold;
    int64_t resetTimeoutSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(breaker.resetTimeout).count();
    int64_t halfOpenMaxCalls = breaker.halfOpenMaxCalls;

    if (auto r = readCount(config, "resilience.circuit_breaker.threshold", kMaxUint32, threshold);
        !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.circuit_breaker.reset_timeout_seconds",
                           kMaxSeconds, resetTimeoutSeconds); !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.circuit_breaker.half_open_max_calls", kMaxUint32,
                           halfOpenMaxCalls); !r) {
        return r;
    }
    if (auto r = readOptional(config, "resilience.circuit_breaker.name", breaker.name); !r) {
        return r;
    }

    breaker.failureThreshold = static_cast<uint32_t>(threshold);
    breaker.resetTimeout = std::chrono::seconds(resetTimeoutSeconds);
    breaker.halfOpenMaxCalls = static_cast<uint32_t>(halfOpenMaxCalls);
    return AgentResult<void>::ok();
}

AgentResult<void> readRateLimit(const ConfigManager& config, TokenBucketLimiterConfig& limit) {
    bool enabled = limit.enabled;
    int64_t rpm = kDefaultRequestsPerMinute;
    int64_t burst = 0;

    if (auto r = readOptional(config, "resilience.rate_limit.enabled", enabled); !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.rate_limit.requests_per_minute", kMaxUint32, rpm);
        !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.rate_limit.burst_capacity", kMaxUint32, burst); !r) {
        return r;
    }

    limit = TokenBucketLimiterConfig::fromRequestsPerMinute(
        static_cast<uint32_t>(rpm),
        burst > 0 ? std::optional<uint32_t>(static_cast<uint32_t>(burst)) : std::nullopt,
        enabled);
    return AgentResult<void>::ok();
}

AgentResult<void> readCache(const ConfigManager& config, ResponseCacheConfig& cache) {
    int64_t maxEntries = static_cast<int64_t>(cache.maxEntries);
    int64_t ttlSeconds = std::chrono::duration_cast<std::chrono::seconds>(cache.ttl).count();

    if (auto r = readOptional(config, "resilience.cache.enabled", cache.enabled); !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.cache.max_entries",
                           std::numeric_limits<int64_t>::max(), maxEntries); !r) {
        return r;
    }
    if (auto r = readCount(config, "resilience.cache.ttl_seconds", kMaxSeconds, ttlSeconds); !r) {
        return r;
    }

    cache.maxEntries = static_cast<std::size_t>(maxEntries);
    cache.ttl = std::chrono::seconds(ttlSeconds);
    return AgentResult<void>::ok();
}

} // namespace

AgentResult<ResilienceConfig> loadResilienceConfig(const ConfigManager& config) {
    ResilienceConfig out;

    if (auto r = readRetry(config, out.retry); !r) {
        return AgentResult<ResilienceConfig>::err(std::move(r).error());
    }
    if (auto r = readCircuitBreaker(config, out.circuitBreaker); !r) {
        return AgentResult<ResilienceConfig>::err(std::move(r).error());
    }
    if (auto r = readRateLimit(config, out.rateLimit); !r) {
        return AgentResult<ResilienceConfig>::err(std::move(r).error());
    }
    if (auto r = readCache(config, out.cache); !r) {
        return AgentResult<ResilienceConfig>::err(std::move(r).error());
    }

    LRA_LOG_CTX(LogLevel::Info, LogCategory::Config, "resilience_config_loaded",
                LogContext{}
                    .add("max_retries", out.retry.maxRetries)
                    .add("breaker_threshold", out.circuitBreaker.failureThreshold)
                    .add("rate_limit_enabled", out.rateLimit.enabled)
                    .add("cache_enabled", out.cache.enabled));
    return AgentResult<ResilienceConfig>::ok(std::move(out));
}

}  // namespace lra::resilience
