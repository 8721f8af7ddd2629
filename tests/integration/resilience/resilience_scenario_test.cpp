/// @file resilience_scenario_test.cpp
/// @brief End-to-end scenarios combining retry, breaker, limiter and cache
///        with real timing.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "lra/lra.hpp"

#include "mocks/mock_logger.hpp"

using namespace lra::resilience;
using lra::foundation::AgentError;
using lra::foundation::AgentResult;
using lra::foundation::ErrorCode;
using namespace std::chrono_literals;

class ResilienceScenarioTest : public lra::test::MockLoggerTest {};

TEST_F(ResilienceScenarioTest, FlakyOperationRecoversOnThirdAttempt) {
    auto policy = RetryPolicy::create({.maxRetries = 2,
                                       .initialDelay = 50ms,
                                       .maxDelay = 30000ms,
                                       .multiplier = 2.0,
                                       .jitterFraction = 0.0}).value();

    int calls = 0;
    std::vector<double> delays;
    auto start = std::chrono::steady_clock::now();

    auto result = runWithRetry(
        [&] {
            ++calls;
            if (calls < 3) {
                return AgentResult<std::string>::err(
                    AgentError(ErrorCode::ConnectionRefused, "connection refused"));
            }
            return AgentResult<std::string>::ok("pong");
        },
        policy, isRetriable, nullptr,
        [&](const RetryOutcome& outcome) { delays.push_back(outcome.delay.count()); });

    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "pong");
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(delays.size(), 2u);
    EXPECT_DOUBLE_EQ(delays[0], 50.0);
    EXPECT_DOUBLE_EQ(delays[1], 100.0);
    EXPECT_GE(elapsed, 150ms);
}

TEST_F(ResilienceScenarioTest, RetryExhaustionOpensBreakerThenRejectsWithoutInvoking) {
    auto breaker = CircuitBreaker::create({.failureThreshold = 2,
                                           .resetTimeout = 60000ms,
                                           .halfOpenMaxCalls = 1,
                                           .name = "inference"}).value();
    auto policy = RetryPolicy::create({.maxRetries = 1,
                                       .initialDelay = 10ms,
                                       .maxDelay = 100ms,
                                       .multiplier = 2.0,
                                       .jitterFraction = 0.0}).value();
    RetryExecutor retry(policy, isRetriable, breaker.get());

    int calls = 0;
    auto alwaysTimesOut = [&] {
        ++calls;
        return AgentResult<std::string>::err(AgentError(ErrorCode::Timeout, "read timed out"));
    };

    auto first = retry.run(alwaysTimesOut);
    ASSERT_TRUE(first.hasError());
    EXPECT_EQ(first.error().code(), ErrorCode::RetryExhausted);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(breaker->state(), CircuitBreaker::State::Open);

    auto second = retry.run(alwaysTimesOut);
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::CircuitOpen);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(classifyFailure(second.error()), FailureKind::CircuitOpen);
}

TEST_F(ResilienceScenarioTest, BreakerRecoversThroughHalfOpenTrial) {
    auto breaker = CircuitBreaker::create({.failureThreshold = 2,
                                           .resetTimeout = 100ms,
                                           .halfOpenMaxCalls = 1,
                                           .name = "inference"}).value();
    auto policy = RetryPolicy::create({.maxRetries = 0}).value();
    RetryExecutor retry(policy, isRetriable, breaker.get());

    bool healthy = false;
    auto backend = [&] {
        if (!healthy) {
            return AgentResult<int>::err(AgentError(ErrorCode::ConnectionReset, "reset"));
        }
        return AgentResult<int>::ok(200);
    };

    (void)retry.run(backend);
    (void)retry.run(backend);
    ASSERT_EQ(breaker->state(), CircuitBreaker::State::Open);

    healthy = true;
    EXPECT_EQ(retry.run(backend).error().code(), ErrorCode::CircuitOpen);

    std::this_thread::sleep_for(150ms);
    auto recovered = retry.run(backend);
    ASSERT_TRUE(recovered.hasValue());
    EXPECT_EQ(recovered.value(), 200);
    EXPECT_EQ(breaker->state(), CircuitBreaker::State::Closed);
}

TEST_F(ResilienceScenarioTest, CacheKeepsTwoMostRecentEntries) {
    ResponseCache<std::string> cache({.maxEntries = 2, .ttl = 0ms});
    cache.set("a", "A");
    cache.set("b", "B");
    cache.set("c", "C");

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.get("b"), "B");
    EXPECT_EQ(cache.get("c"), "C");
}

TEST_F(ResilienceScenarioTest, LimiterPacesConcurrentCallers) {
    auto limiter = TokenBucketLimiter::create({.capacity = 2.0,
                                               .refillPerSecond = 20.0}).value();

    std::atomic<int> granted{0};
    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            if (limiter->acquire(2000ms)) {
                granted.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& t : threads) { t.join(); }
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Two tokens up front, the other two at 20/s.
    EXPECT_EQ(granted.load(), 4);
    EXPECT_GE(elapsed, 90ms);
}

TEST_F(ResilienceScenarioTest, StackFromYamlServesRequests) {
    lra::foundation::ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
resilience:
  retry:
    max_retries: 1
    initial_delay_ms: 5
    jitter: 0
  circuit_breaker:
    threshold: 2
  rate_limit:
    enabled: true
    requests_per_minute: 600
  cache:
    max_entries: 4
)").hasValue());

    auto settings = loadResilienceConfig(config);
    ASSERT_TRUE(settings.hasValue());
    auto stack = lra::agent::ResilienceStack::create(settings.value()).value();

    int calls = 0;
    auto backend = [&] {
        ++calls;
        return AgentResult<std::string>::ok("reply");
    };

    for (int i = 0; i < 5; ++i) {
        auto reply = stack->inference().complete("same prompt", backend);
        ASSERT_TRUE(reply.hasValue());
    }

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(stack->cache().stats().hits, 4u);
    EXPECT_EQ(stack->inference().healthSnapshot().status, lra::agent::HealthStatus::Healthy);
}
