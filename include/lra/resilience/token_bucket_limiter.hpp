#pragma once

/// @file token_bucket_limiter.hpp
/// @brief Token bucket admission control for outbound inference calls.
///
/// The bucket fills continuously at refillPerSecond and holds at most
/// `capacity` tokens, so short bursts are allowed while the sustained rate
/// stays bounded. Tokens are fractional; refill is computed lazily from the
/// elapsed steady-clock time on every access.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "lra/foundation/agent_result.hpp"

namespace lra::resilience {

/// Configuration for a TokenBucketLimiter.
struct TokenBucketLimiterConfig {
    /// Maximum tokens held (burst size). Must be > 0.
    double capacity = 10.0;

    /// Tokens added per second. Must be > 0.
    double refillPerSecond = 1.0;

    /// When false every acquisition succeeds immediately (still counted).
    bool enabled = true;

    /// Derive bucket parameters from a requests-per-minute budget.
    /// Burst defaults to rpm / 6, at least 1.
    [[nodiscard]] static TokenBucketLimiterConfig fromRequestsPerMinute(
        uint32_t requestsPerMinute,
        std::optional<uint32_t> burstCapacity = std::nullopt,
        bool enabled = true);
};

/// Cumulative limiter counters.
struct RateLimitStats {
    uint64_t totalRequests = 0;      ///< Granted acquisitions.
    uint64_t throttledRequests = 0;  ///< Waits scheduled for a refill.
    uint64_t timedOutRequests = 0;   ///< Acquisitions abandoned at the deadline.
    double totalWaitMs = 0.0;
    double maxWaitMs = 0.0;
    std::chrono::system_clock::time_point windowStart = std::chrono::system_clock::now();

    [[nodiscard]] double avgWaitMs() const noexcept {
        return throttledRequests > 0 ? totalWaitMs / static_cast<double>(throttledRequests) : 0.0;
    }

    /// Throttled share of granted requests, as a percentage.
    [[nodiscard]] double throttleRate() const noexcept {
        return totalRequests > 0
            ? static_cast<double>(throttledRequests) / static_cast<double>(totalRequests) * 100.0
            : 0.0;
    }
};

[[nodiscard]] std::string toString(const RateLimitStats& stats);

/// Process-local token bucket limiter.
///
/// Example:
/// @code
///   auto limiter = TokenBucketLimiter::create(
///       TokenBucketLimiterConfig::fromRequestsPerMinute(60)).value();
///   if (!limiter->acquire(std::chrono::milliseconds(5000))) {
///       // deadline passed before a token was available
///   }
/// @endcode
///
/// Thread-safe. Waiters sleep without holding the lock and re-check on
/// wake-up, so concurrent waiters are NOT served in arrival order; a late
/// caller may take a token ahead of one that has been waiting longer.
class TokenBucketLimiter {
public:
    /// Validate the configuration and build a full bucket.
    /// @return InvalidArgument when capacity or refill rate is not positive.
    [[nodiscard]] static lra::foundation::AgentResult<std::unique_ptr<TokenBucketLimiter>> create(
        TokenBucketLimiterConfig config = {});

    TokenBucketLimiter(const TokenBucketLimiter&) = delete;
    TokenBucketLimiter& operator=(const TokenBucketLimiter&) = delete;

    /// Take one token, sleeping for refills as needed.
    ///
    /// @param timeout Give up (returning false, without waiting) as soon as
    ///        the next required wait would run past this deadline. nullopt
    ///        waits indefinitely.
    /// @return true once a token was consumed.
    [[nodiscard]] bool acquire(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// acquire() reporting a missed deadline as ErrorCode::RateLimitTimeout.
    [[nodiscard]] lra::foundation::AgentResult<void> acquireOrError(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Take one token only if available right now.
    [[nodiscard]] bool tryAcquire();

    /// Current token count after lazy refill; never exceeds capacity.
    [[nodiscard]] double availableTokens();

    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const;

    [[nodiscard]] const TokenBucketLimiterConfig& config() const noexcept { return config_; }

    [[nodiscard]] RateLimitStats stats() const;
    void resetStats();

private:
    explicit TokenBucketLimiter(TokenBucketLimiterConfig config);

    // Callers hold mutex_.
    void refill(std::chrono::steady_clock::time_point now);

    TokenBucketLimiterConfig config_;
    mutable std::mutex mutex_;
    bool enabled_;
    double tokens_;
    std::chrono::steady_clock::time_point lastRefill_;
    RateLimitStats stats_;
};

}  // namespace lra::resilience
