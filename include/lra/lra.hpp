#pragma once

/// @file lra.hpp
/// @brief Umbrella header for the lra core library.

#include "lra/version.hpp"
#include "lra/core/result.hpp"

#include "lra/foundation/agent_error.hpp"
#include "lra/foundation/agent_logger.hpp"
#include "lra/foundation/agent_result.hpp"
#include "lra/foundation/config_manager.hpp"
#include "lra/foundation/error_code.hpp"

#include "lra/resilience/cache_key.hpp"
#include "lra/resilience/circuit_breaker.hpp"
#include "lra/resilience/failure.hpp"
#include "lra/resilience/resilience_config.hpp"
#include "lra/resilience/response_cache.hpp"
#include "lra/resilience/retry_executor.hpp"
#include "lra/resilience/retry_policy.hpp"
#include "lra/resilience/token_bucket_limiter.hpp"

#include "lra/agent/guarded_inference.hpp"
#include "lra/agent/resilience_stack.hpp"
