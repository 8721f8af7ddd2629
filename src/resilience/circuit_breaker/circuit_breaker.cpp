/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "lra/resilience/circuit_breaker.hpp"

#include <sstream>

#include "lra/foundation/agent_logger.hpp"

namespace lra::resilience {

using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::ErrorCode;
using lra::foundation::LogCategory;
using lra::foundation::LogContext;
using lra::foundation::LogLevel;

AgentResult<std::unique_ptr<CircuitBreaker>> CircuitBreaker::create(CircuitBreakerConfig config) {
    using R = AgentResult<std::unique_ptr<CircuitBreaker>>;
    if (config.failureThreshold < 1) {
        return R::err(AgentError(ErrorCode::InvalidArgument,
                                 "invalid circuit breaker: threshold must be positive"));
    }
    if (config.resetTimeout <= std::chrono::milliseconds::zero()) {
        return R::err(AgentError(ErrorCode::InvalidArgument,
                                 "invalid circuit breaker: reset_timeout must be positive"));
    }
    if (config.halfOpenMaxCalls < 1) {
        return R::err(AgentError(ErrorCode::InvalidArgument,
                                 "invalid circuit breaker: half_open_max_calls must be positive"));
    }
    return R::ok(std::unique_ptr<CircuitBreaker>(new CircuitBreaker(std::move(config))));
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config)) {
    stats_.lastStateChange = std::chrono::system_clock::now();

    LRA_LOG_CTX(LogLevel::Info, LogCategory::CircuitBreaker, "circuit_breaker_initialized",
                LogContext{}
                    .add("name", config_.name)
                    .add("threshold", config_.failureThreshold)
                    .add("reset_timeout_ms", config_.resetTimeout.count()));
}

AgentResult<void> CircuitBreaker::allowRequest() {
    std::lock_guard lock(mutex_);

    if (state_ == State::Open && resetTimeoutElapsed()) {
        transitionTo(State::HalfOpen);
    }

    switch (state_) {
        case State::Closed:
            return AgentResult<void>::ok();

        case State::Open:
            ++stats_.rejectedCount;
            LRA_LOG_CTX(LogLevel::Warning, LogCategory::CircuitBreaker, "circuit_breaker_open",
                        LogContext{}.add("name", config_.name).add("failures", consecutiveFailures_));
            return AgentResult<void>::err(AgentError(
                ErrorCode::CircuitOpen,
                "circuit breaker '" + config_.name + "' is open (failures: " +
                    std::to_string(consecutiveFailures_) + ")"));

        case State::HalfOpen:
            if (halfOpenInFlight_ >= config_.halfOpenMaxCalls) {
                ++stats_.rejectedCount;
                return AgentResult<void>::err(AgentError(
                    ErrorCode::CircuitHalfOpenLimit,
                    "circuit breaker '" + config_.name + "' is half-open (max calls reached)"));
            }
            ++halfOpenInFlight_;
            return AgentResult<void>::ok();
    }
    return AgentResult<void>::ok();
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard lock(mutex_);

    ++stats_.totalSuccesses;

    switch (state_) {
        case State::Closed:
            consecutiveFailures_ = 0;
            break;

        case State::HalfOpen:
            LRA_LOG_CTX(LogLevel::Info, LogCategory::CircuitBreaker, "circuit_breaker_closed",
                        LogContext{}.add("name", config_.name));
            transitionTo(State::Closed);
            break;

        case State::Open:
            // A call admitted before the circuit opened finished late.
            break;
    }
    stats_.consecutiveFailures = consecutiveFailures_;
}

void CircuitBreaker::recordFailure() {
    std::lock_guard lock(mutex_);

    ++consecutiveFailures_;
    ++stats_.totalFailures;
    lastFailureTime_ = std::chrono::steady_clock::now();
    stats_.lastFailureTime = std::chrono::system_clock::now();

    switch (state_) {
        case State::Closed:
            if (consecutiveFailures_ >= config_.failureThreshold) {
                LRA_LOG_CTX(LogLevel::Warning, LogCategory::CircuitBreaker,
                            "circuit_breaker_opened",
                            LogContext{}
                                .add("name", config_.name)
                                .add("failures", consecutiveFailures_)
                                .add("threshold", config_.failureThreshold));
                transitionTo(State::Open);
            }
            break;

        case State::HalfOpen:
            // Recovery probe failed; re-open and restart the timeout.
            LRA_LOG_CTX(LogLevel::Warning, LogCategory::CircuitBreaker,
                        "circuit_breaker_opened_from_half_open",
                        LogContext{}.add("name", config_.name));
            transitionTo(State::Open);
            break;

        case State::Open:
            break;
    }
    stats_.consecutiveFailures = consecutiveFailures_;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    if (state_ != State::Closed) {
        ++stats_.stateChanges;
        stats_.lastStateChange = std::chrono::system_clock::now();
    }
    state_ = State::Closed;
    consecutiveFailures_ = 0;
    halfOpenInFlight_ = 0;
    lastFailureTime_.reset();
    stats_.consecutiveFailures = 0;
    stats_.rejectedCount = 0;

    LRA_LOG_CTX(LogLevel::Info, LogCategory::CircuitBreaker, "circuit_breaker_reset",
                LogContext{}.add("name", config_.name));
}

void CircuitBreaker::forceState(State newState) {
    std::lock_guard lock(mutex_);
    transitionTo(newState);
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::failureCount() const {
    std::lock_guard lock(mutex_);
    return consecutiveFailures_;
}

uint32_t CircuitBreaker::halfOpenCallsInFlight() const {
    std::lock_guard lock(mutex_);
    return halfOpenInFlight_;
}

uint64_t CircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return stats_.rejectedCount;
}

std::string_view CircuitBreaker::name() const noexcept {
    return config_.name;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

void CircuitBreaker::resetStats() {
    std::lock_guard lock(mutex_);
    stats_ = CircuitBreakerStats{};
    stats_.consecutiveFailures = consecutiveFailures_;
    stats_.lastStateChange = std::chrono::system_clock::now();
}

void CircuitBreaker::transitionTo(State newState) {
    if (newState != state_) {
        ++stats_.stateChanges;
        stats_.lastStateChange = std::chrono::system_clock::now();
    }
    state_ = newState;
    halfOpenInFlight_ = 0;

    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
        stats_.consecutiveFailures = 0;
    } else if (newState == State::Open) {
        // The reset timeout counts from the moment the circuit opens.
        lastFailureTime_ = std::chrono::steady_clock::now();
    } else {
        LRA_LOG_CTX(LogLevel::Info, LogCategory::CircuitBreaker, "circuit_breaker_half_open",
                    LogContext{}.add("name", config_.name));
    }
}

bool CircuitBreaker::resetTimeoutElapsed() const {
    if (!lastFailureTime_) {
        return false;
    }
    return std::chrono::steady_clock::now() - *lastFailureTime_ >= config_.resetTimeout;
}

std::string toString(const CircuitBreakerStats& stats) {
    std::ostringstream oss;
    oss << "successes=" << stats.totalSuccesses
        << " failures=" << stats.totalFailures
        << " consecutive_failures=" << stats.consecutiveFailures
        << " state_changes=" << stats.stateChanges
        << " rejected=" << stats.rejectedCount;
    auto sinceChange = std::chrono::duration<double>(
        std::chrono::system_clock::now() - stats.lastStateChange);
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << " since_state_change_s=" << sinceChange.count();
    return oss.str();
}

}  // namespace lra::resilience
