/// @file guarded_inference.cpp
/// @brief GuardedInference call pipeline and health reporting.

#include "lra/agent/guarded_inference.hpp"

#include <sstream>

#include "lra/foundation/agent_logger.hpp"
#include "lra/resilience/failure.hpp"

namespace lra::agent {

using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::LogCategory;
using lra::foundation::LogContext;
using lra::foundation::LogLevel;
using lra::resilience::CircuitBreaker;
using lra::resilience::FailureKind;

GuardedInference::GuardedInference(lra::resilience::ResponseCache<std::string>& cache,
                                   lra::resilience::TokenBucketLimiter& limiter,
                                   lra::resilience::CircuitBreaker& breaker,
                                   lra::resilience::RetryExecutor& retry)
    : cache_(cache), limiter_(limiter), breaker_(breaker), retry_(retry) {}

AgentResult<std::string> GuardedInference::complete(std::string_view payload,
                                                    const InferenceOperation& operation,
                                                    const InferenceOptions& options) {
    {
        std::lock_guard lock(statsMutex_);
        ++stats_.requests;
    }

    bool cacheActive = options.useCache && cache_.isEnabled();
    if (cacheActive) {
        if (auto cached = cache_.get(payload)) {
            {
                std::lock_guard lock(statsMutex_);
                ++stats_.cacheHits;
                ++stats_.succeeded;
            }
            LRA_LOG_CTX(LogLevel::Info, LogCategory::Agent, "inference_cache_hit",
                        LogContext{}.add("response_length", cached->size()));
            return AgentResult<std::string>::ok(std::move(*cached));
        }
    }

    if (auto permit = limiter_.acquireOrError(options.acquireTimeout); !permit) {
        recordFailure(permit.error());
        return AgentResult<std::string>::err(std::move(permit).error());
    }

    auto reply = retry_.run([&] { return breaker_.call(operation); });
    if (!reply) {
        recordFailure(reply.error());
        return reply;
    }

    if (cacheActive) {
        cache_.set(payload, reply.value());
    }
    {
        std::lock_guard lock(statsMutex_);
        ++stats_.succeeded;
    }
    LRA_LOG_CTX(LogLevel::Info, LogCategory::Agent, "inference_completed",
                LogContext{}
                    .add("response_length", reply.value().size())
                    .add("cached", cacheActive));
    return reply;
}

std::string GuardedInference::describe(const AgentError& error) {
    return lra::resilience::userFacingMessage(error);
}

HealthCheckResult GuardedInference::healthSnapshot() const {
    HealthCheckResult result;
    result.timestamp = std::chrono::system_clock::now();

    switch (breaker_.state()) {
        case CircuitBreaker::State::Closed:
            result.components["circuit_breaker"] = HealthStatus::Healthy;
            break;
        case CircuitBreaker::State::HalfOpen:
            result.components["circuit_breaker"] = HealthStatus::Degraded;
            break;
        case CircuitBreaker::State::Open:
            result.components["circuit_breaker"] = HealthStatus::Unhealthy;
            break;
    }

    result.components["rate_limiter"] =
        limiter_.isEnabled() && limiter_.availableTokens() < 1.0 ? HealthStatus::Degraded
                                                                 : HealthStatus::Healthy;
    result.components["cache"] = HealthStatus::Healthy;

    // Overall status = worst component status
    for (const auto& [_, status] : result.components) {
        if (status == HealthStatus::Unhealthy) {
            result.status = HealthStatus::Unhealthy;
            break;
        }
        if (status == HealthStatus::Degraded) {
            result.status = HealthStatus::Degraded;
        }
    }
    return result;
}

InferenceStats GuardedInference::stats() const {
    std::lock_guard lock(statsMutex_);
    return stats_;
}

void GuardedInference::resetStats() {
    std::lock_guard lock(statsMutex_);
    stats_ = InferenceStats{};
}

void GuardedInference::recordFailure(const AgentError& error) {
    auto kind = lra::resilience::classifyFailure(error);
    {
        std::lock_guard lock(statsMutex_);
        ++stats_.failed;
        if (kind == FailureKind::RateLimitTimeout) {
            ++stats_.rateLimited;
        } else if (kind == FailureKind::CircuitOpen) {
            ++stats_.circuitRejected;
        }
    }
    LRA_LOG_CTX(LogLevel::Warning, LogCategory::Agent, "inference_failed",
                LogContext{}
                    .add("kind", lra::resilience::toString(kind))
                    .add("error", error.message()));
}

std::string healthToJson(const HealthCheckResult& result) {
    std::ostringstream out;
    out << R"({"status":")" << toString(result.status) << '"';

    if (!result.components.empty()) {
        out << R"(,"components":{)";
        bool first = true;
        for (const auto& [name, status] : result.components) {
            if (!first) { out << ","; }
            first = false;
            out << '"' << name << R"(":")" << toString(status) << '"';
        }
        out << "}";
    }

    out << "}";
    return out.str();
}

std::string toString(const InferenceStats& stats) {
    std::ostringstream oss;
    oss << "requests=" << stats.requests
        << " cache_hits=" << stats.cacheHits
        << " succeeded=" << stats.succeeded
        << " failed=" << stats.failed
        << " rate_limited=" << stats.rateLimited
        << " circuit_rejected=" << stats.circuitRejected;
    return oss.str();
}

}  // namespace lra::agent
