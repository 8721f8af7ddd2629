#pragma once

/// @file agent_error.hpp
/// @brief Error type used with Result<T, AgentError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "lra/foundation/error_code.hpp"

namespace lra::foundation {

/// Error carrying a categorized code, a human-readable message,
/// and optional type-erased context (e.g. an UpstreamStatus).
class AgentError {
public:
    AgentError() = default;

    explicit AgentError(ErrorCode code)
        : code_(code) {}

    AgentError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    AgentError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

/// HTTP status reported by the inference backend, attached as context to
/// ErrorCode::UpstreamHttpError.
struct UpstreamStatus {
    int status = 0;
};

/// Build an UpstreamHttpError carrying its status code.
[[nodiscard]] inline AgentError upstreamHttpError(int status, std::string message = {}) {
    if (message.empty()) {
        message = "upstream returned HTTP " + std::to_string(status);
    }
    return AgentError(ErrorCode::UpstreamHttpError, std::move(message),
                      UpstreamStatus{status});
}

} // namespace lra::foundation
