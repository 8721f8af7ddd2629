/// @file resilience_stack.cpp
/// @brief ResilienceStack construction and reporting.

#include "lra/agent/resilience_stack.hpp"

#include <sstream>

#include "lra/foundation/agent_logger.hpp"
#include "lra/version.hpp"

namespace lra::agent {

using lra::foundation::AgentResult;
using lra::foundation::LogCategory;
using namespace lra::resilience;

AgentResult<std::unique_ptr<ResilienceStack>> ResilienceStack::create(
    const ResilienceConfig& config) {
    using R = AgentResult<std::unique_ptr<ResilienceStack>>;

    auto policy = RetryPolicy::create(config.retry);
    if (!policy) {
        return R::err(std::move(policy).error());
    }
    auto breaker = CircuitBreaker::create(config.circuitBreaker);
    if (!breaker) {
        return R::err(std::move(breaker).error());
    }
    auto limiter = TokenBucketLimiter::create(config.rateLimit);
    if (!limiter) {
        return R::err(std::move(limiter).error());
    }

    std::unique_ptr<ResilienceStack> stack(new ResilienceStack());
    stack->cache_ = std::make_unique<ResponseCache<std::string>>(config.cache);
    stack->limiter_ = std::move(limiter).value();
    stack->breaker_ = std::move(breaker).value();
    // The executor gets no breaker of its own: GuardedInference dispatches
    // each attempt through breaker_ explicitly.
    stack->retry_ = std::make_unique<RetryExecutor>(std::move(policy).value());
    stack->inference_ = std::make_unique<GuardedInference>(
        *stack->cache_, *stack->limiter_, *stack->breaker_, *stack->retry_);

    LRA_LOG_CTX(lra::foundation::LogLevel::Info, LogCategory::Core, "resilience_stack_created",
                lra::foundation::LogContext{}
                    .add("product", Version::product)
                    .add("version", Version::string));
    return R::ok(std::move(stack));
}

std::string ResilienceStack::statsReport() const {
    std::ostringstream out;
    out << "cache:           " << toString(cache_->stats()) << '\n'
        << "rate_limiter:    " << toString(limiter_->stats()) << '\n'
        << "circuit_breaker: state=" << toString(breaker_->state()) << ' '
        << toString(breaker_->stats()) << '\n'
        << "retry:           " << toString(retry_->stats()) << '\n'
        << "inference:       " << toString(inference_->stats()) << '\n';
    return out.str();
}

void ResilienceStack::resetStats() {
    cache_->resetStats();
    limiter_->resetStats();
    breaker_->resetStats();
    retry_->resetStats();
    inference_->resetStats();
}

}  // namespace lra::agent
