/// @file failure.cpp
/// @brief Failure classification and user-facing translation.

#include "lra/resilience/failure.hpp"

namespace lra::resilience {

using lra::foundation::AgentError;
using lra::foundation::ErrorCode;
using lra::foundation::UpstreamStatus;

bool isRetriableHttpStatus(int status) noexcept {
    switch (status) {
        case 429:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

bool isRetriable(const AgentError& error) {
    switch (error.code()) {
        case ErrorCode::Timeout:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionRefused:
        case ErrorCode::ConnectionReset:
        case ErrorCode::ConnectionLost:
        case ErrorCode::BrokenPipe:
        case ErrorCode::RemoteProtocolError:
            return true;

        case ErrorCode::UpstreamHttpError: {
            const auto* status = error.context<UpstreamStatus>();
            return status != nullptr && isRetriableHttpStatus(status->status);
        }

        default:
            return false;
    }
}

FailureKind classifyFailure(const AgentError& error) {
    switch (error.code()) {
        case ErrorCode::RetryExhausted:
            return FailureKind::RetryExhausted;
        case ErrorCode::CircuitOpen:
        case ErrorCode::CircuitHalfOpenLimit:
            return FailureKind::CircuitOpen;
        case ErrorCode::RateLimitTimeout:
            return FailureKind::RateLimitTimeout;
        default:
            return isRetriable(error) ? FailureKind::TransientFailure
                                      : FailureKind::PermanentFailure;
    }
}

std::string userFacingMessage(const AgentError& error) {
    switch (classifyFailure(error)) {
        case FailureKind::CircuitOpen:
        case FailureKind::RetryExhausted:
        case FailureKind::RateLimitTimeout:
        case FailureKind::TransientFailure:
            return std::string(kTemporarilyUnavailableMessage);
        case FailureKind::PermanentFailure:
            break;
    }
    return std::string(error.message());
}

AgentError makeRetryExhausted(uint32_t attempts, AgentError lastError) {
    std::string message = "failed after " + std::to_string(attempts) +
                          " attempts: " + std::string(lastError.message());
    return AgentError(ErrorCode::RetryExhausted, std::move(message),
                      RetryExhaustedInfo{attempts, std::move(lastError)});
}

}  // namespace lra::resilience
