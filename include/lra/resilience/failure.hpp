#pragma once

/// @file failure.hpp
/// @brief Failure taxonomy and the default retry classification.
///
/// Classification is a pure mapping from an AgentError value to a
/// FailureKind; it never depends on how the error was produced.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "lra/foundation/agent_error.hpp"

namespace lra::resilience {

/// The five failure kinds surfaced by the resilience layer.
enum class FailureKind : uint8_t {
    TransientFailure,  ///< Network, timeout or retriable 5xx/429; worth retrying.
    PermanentFailure,  ///< Validation, auth or other 4xx; never retried.
    RetryExhausted,    ///< All attempts consumed; wraps the last transient failure.
    CircuitOpen,       ///< Breaker rejected dispatch without running the operation.
    RateLimitTimeout   ///< Limiter could not grant a token before the deadline.
};

/// Context attached to ErrorCode::RetryExhausted errors.
struct RetryExhaustedInfo {
    uint32_t attempts = 0;
    lra::foundation::AgentError lastError;
};

/// Caller-supplied classifier: true when the error should be retried.
using RetryClassifier = std::function<bool(const lra::foundation::AgentError&)>;

/// Map an error to its failure kind.
[[nodiscard]] FailureKind classifyFailure(const lra::foundation::AgentError& error);

/// Default classifier: timeouts, connection failures (refused, reset,
/// broken pipe, lost), remote protocol errors and HTTP 429/502/503/504
/// are retriable. Everything else is not.
[[nodiscard]] bool isRetriable(const lra::foundation::AgentError& error);

/// HTTP status codes treated as transient.
[[nodiscard]] bool isRetriableHttpStatus(int status) noexcept;

/// Text shown to the end user for a failed request.
///
/// CircuitOpen, RetryExhausted and RateLimitTimeout collapse into a single
/// "temporarily unavailable" message; permanent failures are surfaced
/// verbatim since they usually point at a caller-fixable input problem.
[[nodiscard]] std::string userFacingMessage(const lra::foundation::AgentError& error);

/// Wrap the last transient failure into a RetryExhausted error.
[[nodiscard]] lra::foundation::AgentError makeRetryExhausted(
    uint32_t attempts, lra::foundation::AgentError lastError);

/// Message used for every "try again later" outcome.
inline constexpr std::string_view kTemporarilyUnavailableMessage =
    "The model service is temporarily unavailable, please try again shortly.";

[[nodiscard]] constexpr std::string_view toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::TransientFailure: return "transient";
        case FailureKind::PermanentFailure: return "permanent";
        case FailureKind::RetryExhausted: return "retry_exhausted";
        case FailureKind::CircuitOpen: return "circuit_open";
        case FailureKind::RateLimitTimeout: return "rate_limit_timeout";
    }
    return "unknown";
}

}  // namespace lra::resilience
