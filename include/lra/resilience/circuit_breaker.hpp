#pragma once

/// @file circuit_breaker.hpp
/// @brief Circuit breaker guarding one downstream inference dependency.
///
/// Implements Closed -> Open -> HalfOpen -> Closed so that a consistently
/// failing backend is not hammered by every request. One breaker instance
/// maps to exactly one logical dependency; sharing it across unrelated
/// operations makes its state meaningless.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "lra/foundation/agent_result.hpp"

namespace lra::resilience {

/// Configuration for a CircuitBreaker.
struct CircuitBreakerConfig {
    /// Consecutive failures in Closed before the circuit opens. Must be >= 1.
    uint32_t failureThreshold = 5;

    /// Time the circuit stays open before a trial call is let through.
    std::chrono::milliseconds resetTimeout{60000};

    /// Concurrent trial calls allowed while HalfOpen. Must be >= 1.
    uint32_t halfOpenMaxCalls = 1;

    /// Name used in logs and rejection messages.
    std::string name = "default";
};

/// Cumulative breaker counters; reset with resetStats().
struct CircuitBreakerStats {
    uint64_t totalSuccesses = 0;
    uint64_t totalFailures = 0;
    uint32_t consecutiveFailures = 0;
    uint64_t stateChanges = 0;
    uint64_t rejectedCount = 0;
    std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    std::chrono::system_clock::time_point lastStateChange{};
};

/// Single-line rendering for CLI and health output.
[[nodiscard]] std::string toString(const CircuitBreakerStats& stats);

/// Three-state circuit breaker.
///
/// Usage:
/// @code
///   auto breaker = CircuitBreaker::create({.failureThreshold = 5,
///                                          .name = "ollama"}).value();
///   auto reply = breaker->call([&] { return backend.complete(prompt); });
///   if (!reply && reply.error().code() == ErrorCode::CircuitOpen) {
///       // rejected without touching the backend
///   }
/// @endcode
///
/// Thread-safe: state is evaluated and updated under one mutex, while the
/// guarded operation itself runs unlocked.
class CircuitBreaker {
public:
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovery probe; a limited number of trial calls.
    };

    /// Validate the configuration and build a breaker.
    /// @return InvalidArgument when threshold, timeout or trial quota is invalid.
    [[nodiscard]] static lra::foundation::AgentResult<std::unique_ptr<CircuitBreaker>> create(
        CircuitBreakerConfig config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Run an operation through the breaker.
    ///
    /// The operation must return an AgentResult. It is not invoked when the
    /// breaker rejects the call (CircuitOpen / CircuitHalfOpenLimit). Its
    /// own result, success or error, is returned unchanged after bookkeeping;
    /// a thrown exception is booked as a failure and rethrown.
    template <typename Operation>
    auto call(Operation&& operation) -> std::invoke_result_t<Operation&>;

    /// Decide whether a call may be dispatched now.
    ///
    /// Transitions Open -> HalfOpen once resetTimeout has elapsed since the
    /// last failure and reserves a HalfOpen trial slot when granted.
    [[nodiscard]] lra::foundation::AgentResult<void> allowRequest();

    /// Book a successful call. Closes the circuit when in HalfOpen.
    void recordSuccess();

    /// Book a failed call. May open (or re-open) the circuit.
    void recordFailure();

    /// Administrative override back to Closed with counters zeroed.
    void reset();

    /// Force a state (operator override and tests).
    void forceState(State newState);

    [[nodiscard]] State state() const;
    [[nodiscard]] uint32_t failureCount() const;
    [[nodiscard]] uint32_t halfOpenCallsInFlight() const;
    [[nodiscard]] uint64_t rejectedCount() const;
    [[nodiscard]] std::string_view name() const noexcept;
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    [[nodiscard]] CircuitBreakerStats stats() const;
    void resetStats();

private:
    explicit CircuitBreaker(CircuitBreakerConfig config);

    // Callers hold mutex_.
    void transitionTo(State newState);
    [[nodiscard]] bool resetTimeoutElapsed() const;

    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    State state_{State::Closed};
    uint32_t consecutiveFailures_{0};
    uint32_t halfOpenInFlight_{0};
    std::optional<std::chrono::steady_clock::time_point> lastFailureTime_;
    CircuitBreakerStats stats_;
};

[[nodiscard]] constexpr std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

// --- Template implementation ---

template <typename Operation>
auto CircuitBreaker::call(Operation&& operation) -> std::invoke_result_t<Operation&> {
    using R = std::invoke_result_t<Operation&>;
    static_assert(std::is_same_v<typename R::error_type, lra::foundation::AgentError>,
                  "CircuitBreaker::call requires an operation returning AgentResult<T>");

    auto permit = allowRequest();
    if (!permit) {
        return R::err(std::move(permit).error());
    }

    std::optional<R> result;
    try {
        result.emplace(std::invoke(operation));
    } catch (...) {
        recordFailure();
        throw;
    }

    if (result->hasValue()) {
        recordSuccess();
    } else {
        recordFailure();
    }
    return std::move(*result);
}

}  // namespace lra::resilience
