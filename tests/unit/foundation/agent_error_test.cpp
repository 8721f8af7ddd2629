#include <gtest/gtest.h>

#include <string>

#include "lra/foundation/agent_error.hpp"
#include "lra/foundation/agent_result.hpp"

using namespace lra::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConnectionRefused), "Network");
    EXPECT_EQ(errorSubsystem(ErrorCode::Timeout), "Network");
    EXPECT_EQ(errorSubsystem(ErrorCode::UpstreamHttpError), "Upstream");
    EXPECT_EQ(errorSubsystem(ErrorCode::CircuitOpen), "Resilience");
    EXPECT_EQ(errorSubsystem(ErrorCode::RateLimitTimeout), "Resilience");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// --- AgentError tests ---

TEST(AgentErrorTest, DefaultConstruction) {
    AgentError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(AgentErrorTest, CodeAndMessage) {
    AgentError err(ErrorCode::ModelNotFound, "model llama3 not pulled");
    EXPECT_EQ(err.code(), ErrorCode::ModelNotFound);
    EXPECT_EQ(err.message(), "model llama3 not pulled");
    EXPECT_EQ(err.subsystem(), "Upstream");
}

TEST(AgentErrorTest, WithContext) {
    struct DebugInfo {
        int line = 42;
    };
    AgentError err(ErrorCode::MalformedResponse, "bad json", DebugInfo{99});
    EXPECT_TRUE(err.hasContext());
    auto* info = err.context<DebugInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->line, 99);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(AgentErrorTest, UpstreamHttpErrorCarriesStatus) {
    auto err = upstreamHttpError(503);
    EXPECT_EQ(err.code(), ErrorCode::UpstreamHttpError);
    EXPECT_EQ(err.message(), "upstream returned HTTP 503");
    auto* status = err.context<UpstreamStatus>();
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->status, 503);
}

TEST(AgentErrorTest, UpstreamHttpErrorKeepsCustomMessage) {
    auto err = upstreamHttpError(400, "prompt too long");
    EXPECT_EQ(err.message(), "prompt too long");
    EXPECT_EQ(err.context<UpstreamStatus>()->status, 400);
}

// --- AgentResult tests ---

TEST(AgentResultTest, OkValue) {
    auto result = AgentResult<std::string>::ok("hello");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "hello");
}

TEST(AgentResultTest, ErrorValue) {
    auto result = AgentResult<std::string>::err(AgentError(ErrorCode::Timeout, "read timed out"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
}

TEST(AgentResultTest, VoidOk) {
    auto result = AgentResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(AgentResultTest, VoidError) {
    auto result = AgentResult<void>::err(AgentError(ErrorCode::NotImplemented, "todo"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotImplemented);
}
