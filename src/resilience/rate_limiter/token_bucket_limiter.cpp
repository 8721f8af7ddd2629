/// @file token_bucket_limiter.cpp
/// @brief TokenBucketLimiter implementation.

#include "lra/resilience/token_bucket_limiter.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

#include "lra/foundation/agent_logger.hpp"

namespace lra::resilience {

using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::ErrorCode;
using lra::foundation::LogCategory;
using lra::foundation::LogContext;
using lra::foundation::LogLevel;

TokenBucketLimiterConfig TokenBucketLimiterConfig::fromRequestsPerMinute(
    uint32_t requestsPerMinute, std::optional<uint32_t> burstCapacity, bool enabled) {
    TokenBucketLimiterConfig config;
    config.refillPerSecond = static_cast<double>(requestsPerMinute) / 60.0;
    uint32_t burst = burstCapacity.value_or(0);
    if (burst == 0) {
        burst = std::max<uint32_t>(1, requestsPerMinute / 6);
    }
    config.capacity = static_cast<double>(burst);
    config.enabled = enabled;
    return config;
}

AgentResult<std::unique_ptr<TokenBucketLimiter>> TokenBucketLimiter::create(
    TokenBucketLimiterConfig config) {
    using R = AgentResult<std::unique_ptr<TokenBucketLimiter>>;
    // Negated comparisons also reject NaN.
    if (!(config.capacity > 0.0)) {
        return R::err(AgentError(ErrorCode::InvalidArgument,
                                 "invalid rate limiter: capacity must be positive"));
    }
    if (!(config.refillPerSecond > 0.0)) {
        return R::err(AgentError(ErrorCode::InvalidArgument,
                                 "invalid rate limiter: refill rate must be positive"));
    }
    return R::ok(std::unique_ptr<TokenBucketLimiter>(new TokenBucketLimiter(config)));
}

TokenBucketLimiter::TokenBucketLimiter(TokenBucketLimiterConfig config)
    : config_(config),
      enabled_(config.enabled),
      tokens_(config.capacity),
      lastRefill_(std::chrono::steady_clock::now()) {
    LRA_LOG_CTX(LogLevel::Info, LogCategory::RateLimit, "rate_limiter_initialized",
                LogContext{}
                    .add("capacity", config_.capacity)
                    .add("refill_per_second", config_.refillPerSecond)
                    .add("enabled", config_.enabled));
}

bool TokenBucketLimiter::acquire(std::optional<std::chrono::milliseconds> timeout) {
    const auto start = std::chrono::steady_clock::now();

    while (true) {
        std::chrono::duration<double> wait{};
        {
            std::lock_guard lock(mutex_);
            if (!enabled_) {
                ++stats_.totalRequests;
                return true;
            }

            auto now = std::chrono::steady_clock::now();
            refill(now);
            if (tokens_ >= 1.0) {
                tokens_ -= 1.0;
                ++stats_.totalRequests;
                return true;
            }

            wait = std::chrono::duration<double>((1.0 - tokens_) / config_.refillPerSecond);
            if (timeout && (now - start) + wait > *timeout) {
                ++stats_.timedOutRequests;
                LRA_LOG_CTX(LogLevel::Debug, LogCategory::RateLimit, "rate_limit_timeout",
                            LogContext{}
                                .add("timeout_ms", timeout->count())
                                .add("tokens", tokens_));
                return false;
            }

            double waitMs = std::chrono::duration<double, std::milli>(wait).count();
            ++stats_.throttledRequests;
            stats_.totalWaitMs += waitMs;
            stats_.maxWaitMs = std::max(stats_.maxWaitMs, waitMs);

            LRA_LOG_CTX(LogLevel::Debug, LogCategory::RateLimit, "rate_limit_throttle",
                        LogContext{}.add("wait_ms", waitMs).add("tokens", tokens_));
        }

        // Sleep unlocked; another caller may take the refilled token first.
        std::this_thread::sleep_for(std::chrono::ceil<std::chrono::microseconds>(wait));
    }
}

AgentResult<void> TokenBucketLimiter::acquireOrError(
    std::optional<std::chrono::milliseconds> timeout) {
    if (acquire(timeout)) {
        return AgentResult<void>::ok();
    }
    return AgentResult<void>::err(AgentError(
        ErrorCode::RateLimitTimeout,
        "rate limit: no token available within " +
            std::to_string(timeout.value_or(std::chrono::milliseconds::zero()).count()) + "ms"));
}

bool TokenBucketLimiter::tryAcquire() {
    std::lock_guard lock(mutex_);
    if (!enabled_) {
        ++stats_.totalRequests;
        return true;
    }

    refill(std::chrono::steady_clock::now());
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    ++stats_.totalRequests;
    return true;
}

double TokenBucketLimiter::availableTokens() {
    std::lock_guard lock(mutex_);
    refill(std::chrono::steady_clock::now());
    return tokens_;
}

void TokenBucketLimiter::setEnabled(bool enabled) {
    std::lock_guard lock(mutex_);
    enabled_ = enabled;
}

bool TokenBucketLimiter::isEnabled() const {
    std::lock_guard lock(mutex_);
    return enabled_;
}

RateLimitStats TokenBucketLimiter::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

void TokenBucketLimiter::resetStats() {
    std::lock_guard lock(mutex_);
    stats_ = RateLimitStats{};
}

void TokenBucketLimiter::refill(std::chrono::steady_clock::time_point now) {
    auto elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    tokens_ = std::min(tokens_ + elapsed * config_.refillPerSecond, config_.capacity);
    lastRefill_ = now;
}

std::string toString(const RateLimitStats& stats) {
    auto window = std::chrono::duration<double>(
        std::chrono::system_clock::now() - stats.windowStart);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << "requests=" << stats.totalRequests
        << " throttled=" << stats.throttledRequests
        << " timed_out=" << stats.timedOutRequests;
    oss.precision(1);
    oss << " throttle_rate=" << stats.throttleRate() << '%';
    oss.precision(2);
    oss << " avg_wait_ms=" << stats.avgWaitMs()
        << " max_wait_ms=" << stats.maxWaitMs
        << " window_s=" << window.count();
    return oss.str();
}

}  // namespace lra::resilience
