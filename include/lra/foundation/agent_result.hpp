#pragma once

/// @file agent_result.hpp
/// @brief AgentResult<T> alias used across the agent runtime.

#include "lra/core/result.hpp"
#include "lra/foundation/agent_error.hpp"

namespace lra::foundation {

/// Result type specialized with AgentError.
///
/// Example:
/// @code
///   AgentResult<std::string> runInference(std::string_view prompt) {
///       if (prompt.empty()) {
///           return AgentResult<std::string>::err(
///               AgentError(ErrorCode::InvalidArgument, "empty prompt"));
///       }
///       return AgentResult<std::string>::ok(backend.generate(prompt));
///   }
/// @endcode
template <typename T>
using AgentResult = lra::Result<T, AgentError>;

}  // namespace lra::foundation
