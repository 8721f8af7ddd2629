#pragma once

/// @file agent_logger.hpp
/// @brief AgentLogger wrapping kcenon common_system logging for the agent runtime.
///
/// Provides category-based filtering, key=value structured context and
/// per-category runtime log levels. Output is routed through the kcenon
/// GlobalLoggerRegistry so the host process decides where lines end up.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lra/foundation/agent_result.hpp"

namespace lra::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per runtime subsystem.
enum class LogCategory : uint8_t {
    Core           = 0, ///< Process lifecycle, wiring
    Cache          = 1, ///< Response cache
    RateLimit      = 2, ///< Token bucket admission control
    CircuitBreaker = 3, ///< Breaker state machine
    Retry          = 4, ///< Retry/backoff loop
    Agent          = 5, ///< Inference orchestration
    Config         = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Cache", "RateLimit", "CircuitBreaker", "Retry", "Agent", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields attached to a log entry.
///
/// Fields keep insertion order so the rendered line is stable.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.add("attempt", 2).add("delay_ms", 1840.5);
///   logger.logWithContext(LogLevel::Info, LogCategory::Retry,
///                         "retry_attempt", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> requestId;
    std::vector<std::pair<std::string, std::string>> fields;

    LogContext& add(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    LogContext& add(std::string key, std::string_view value) {
        return add(std::move(key), std::string(value));
    }

    LogContext& add(std::string key, const char* value) {
        return add(std::move(key), std::string(value));
    }

    LogContext& add(std::string key, bool value) {
        return add(std::move(key), std::string(value ? "true" : "false"));
    }

    template <typename N>
    LogContext& add(std::string key, N value) {
        return add(std::move(key), std::to_string(value));
    }
};

/// Logger facade over kcenon's logging interfaces.
///
/// Each category resolves a named logger ("lra.<Category>") from the
/// GlobalLoggerRegistry and falls back to the registry's default logger.
///
/// Default log levels per category:
/// | Category       | Default Level |
/// |----------------|---------------|
/// | Core           | Info          |
/// | Cache          | Info          |
/// | RateLimit      | Info          |
/// | CircuitBreaker | Info          |
/// | Retry          | Info          |
/// | Agent          | Info          |
/// | Config         | Info          |
class AgentLogger {
public:
    AgentLogger();
    ~AgentLogger();

    AgentLogger(const AgentLogger&) = delete;
    AgentLogger& operator=(const AgentLogger&) = delete;
    AgentLogger(AgentLogger&&) noexcept;
    AgentLogger& operator=(AgentLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {k=v, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    AgentResult<void> flush();

    /// Process-wide logger, created on first use and alive until exit.
    static AgentLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lra::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name LRA_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define LRA_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef LRA_MIN_LOG_LEVEL
    #define LRA_MIN_LOG_LEVEL 0
#endif

#define LRA_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= LRA_MIN_LOG_LEVEL &&                       \
            ::lra::foundation::AgentLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::lra::foundation::AgentLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

/// Context expression is only evaluated when the level is enabled.
#define LRA_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= LRA_MIN_LOG_LEVEL &&                       \
            ::lra::foundation::AgentLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::lra::foundation::AgentLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                    \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define LRA_LOG_DEBUG(cat, msg) \
    LRA_LOG(::lra::foundation::LogLevel::Debug, (cat), (msg))

#define LRA_LOG_INFO(cat, msg) \
    LRA_LOG(::lra::foundation::LogLevel::Info, (cat), (msg))

#define LRA_LOG_WARN(cat, msg) \
    LRA_LOG(::lra::foundation::LogLevel::Warning, (cat), (msg))

#define LRA_LOG_ERROR(cat, msg) \
    LRA_LOG(::lra::foundation::LogLevel::Error, (cat), (msg))

/// @}
