#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common_system logger interfaces.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control for the ECS runtime.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pecs/foundation/game_result.hpp"
#include "pecs/foundation/types.hpp"

namespace pecs::foundation {

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

/// Runtime subsystems used as log categories.
enum class LogCategory : uint8_t {
    Core          = 0, ///< World construction and frame driver
    ECS           = 1, ///< Entities, pools, systems
    Events        = 2, ///< Event bus delivery
    Spatial       = 3, ///< Spatial grid
    Physics       = 4, ///< Physics integration
    Collision     = 5, ///< Collision detection and dispatch
    Template      = 6, ///< Component templates
    Serialization = 7  ///< Snapshots and persistence
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Events", "Spatial", "Physics", "Collision",
        "Template", "Serialization"
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = entity.Id();
///   ctx.eventType = "collision";
///   logger.logWithContext(LogLevel::Error, LogCategory::Events,
///                         "listener threw", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<std::string> systemName;
    std::optional<std::string> eventType;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger.  Uses PIMPL to keep kcenon headers out of the
/// public API.
///
/// Default log levels per category:
/// | Category      | Default Level |
/// |---------------|---------------|
/// | Core          | Info          |
/// | ECS           | Info          |
/// | Events        | Info          |
/// | Spatial       | Info          |
/// | Physics       | Warning       |
/// | Collision     | Info          |
/// | Template      | Info          |
/// | Serialization | Info          |
///
/// Physics defaults to Warning because it runs for every entity every frame.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as
    /// key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the backing logger.
    GameResult<void> flush();

    /// Process-wide logger used by the PECS_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace"/"debug"/"info"/"warning"/"error"/"critical"/"off"
/// (case-insensitive).  Returns std::nullopt for anything else.
std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace pecs::foundation

/// @name PECS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// PECS_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef PECS_MIN_LOG_LEVEL
    #define PECS_MIN_LOG_LEVEL 0
#endif

#define PECS_LOG(level, cat, msg)                                                 \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= PECS_MIN_LOG_LEVEL &&                      \
            ::pecs::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::pecs::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define PECS_LOG_TRACE(cat, msg) \
    PECS_LOG(::pecs::foundation::LogLevel::Trace, (cat), (msg))

#define PECS_LOG_DEBUG(cat, msg) \
    PECS_LOG(::pecs::foundation::LogLevel::Debug, (cat), (msg))

#define PECS_LOG_INFO(cat, msg) \
    PECS_LOG(::pecs::foundation::LogLevel::Info, (cat), (msg))

#define PECS_LOG_WARN(cat, msg) \
    PECS_LOG(::pecs::foundation::LogLevel::Warning, (cat), (msg))

#define PECS_LOG_ERROR(cat, msg) \
    PECS_LOG(::pecs::foundation::LogLevel::Error, (cat), (msg))

/// @}
