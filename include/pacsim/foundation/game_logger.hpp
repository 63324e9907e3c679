#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common logger interface.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pacsim/foundation/game_result.hpp"

namespace pacsim::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per simulation concern.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Controller lifecycle and frame driver
    ECS      = 1, ///< Registry and system scheduling
    Input    = 2, ///< Input intents
    AI       = 3, ///< Ghost mode and targeting
    Movement = 4, ///< Grid motion and tunnel wrap
    Gameplay = 5, ///< Eating, power-ups, collisions
    Config   = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Input", "AI", "Movement", "Gameplay", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = ghost.id();
///   ctx.extra["points"] = "400";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Gameplay,
///                         "Ghost eaten", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger over kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to the named logger "pacsim.<Category>" when one
/// is registered, otherwise to the registry's default logger.  Uses PIMPL
/// to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Info          |
/// | Input    | Info          |
/// | AI       | Debug         |
/// | Movement | Info          |
/// | Gameplay | Debug         |
/// | Config   | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as `{key=val, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the PACSIM_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pacsim::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name PACSIM_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// PACSIM_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef PACSIM_MIN_LOG_LEVEL
    #define PACSIM_MIN_LOG_LEVEL 0
#endif

#define PACSIM_LOG(level, cat, msg)                                                  \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= PACSIM_MIN_LOG_LEVEL &&                       \
            ::pacsim::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::pacsim::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define PACSIM_LOG_TRACE(cat, msg) \
    PACSIM_LOG(::pacsim::foundation::LogLevel::Trace, (cat), (msg))

#define PACSIM_LOG_DEBUG(cat, msg) \
    PACSIM_LOG(::pacsim::foundation::LogLevel::Debug, (cat), (msg))

#define PACSIM_LOG_INFO(cat, msg) \
    PACSIM_LOG(::pacsim::foundation::LogLevel::Info, (cat), (msg))

#define PACSIM_LOG_WARN(cat, msg) \
    PACSIM_LOG(::pacsim::foundation::LogLevel::Warning, (cat), (msg))

#define PACSIM_LOG_ERROR(cat, msg) \
    PACSIM_LOG(::pacsim::foundation::LogLevel::Error, (cat), (msg))

/// @}
