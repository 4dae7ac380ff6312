/**
 * @file Log.hpp
 * @brief Tagged, levelled logging behind a replaceable sink.
 *
 * Every subsystem logs through Log with a short tag ("GPU", "PATH", "NET",
 * "SVC"). The default sink writes one UTC-stamped line per entry to
 * stderr; tests install their own ILogger to capture entries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef GPO_CORE_LOG_HPP
    #define GPO_CORE_LOG_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <string_view>

namespace gpo::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/**
 * @brief Parses a level name, case-insensitively.
 *
 * Accepts debug (alias trace), info, warn (alias warning), error, fatal.
 */
[[nodiscard]] Expected<LogLevel> parseLogLevel(std::string_view name);

class ILogger {
public:
    virtual ~ILogger() = default;

    /// Called concurrently from any thread; implementations serialize.
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Process-wide logging entry point.
 *
 * Entries below @ref minLevel are dropped before reaching the sink. Build
 * costly debug messages only when @ref enabled says they will be kept.
 */
class Log final {
public:
    Log() = delete;

    /// @p logger must outlive its installation; nullptr restores stderr.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();
    [[nodiscard]] static bool enabled(LogLevel level);

    static void write(LogLevel level, std::string_view tag, std::string_view msg);

    static void debug(std::string_view tag, std::string_view msg) { write(LogLevel::kDebug, tag, msg); }
    static void info (std::string_view tag, std::string_view msg) { write(LogLevel::kInfo,  tag, msg); }
    static void warn (std::string_view tag, std::string_view msg) { write(LogLevel::kWarn,  tag, msg); }
    static void error(std::string_view tag, std::string_view msg) { write(LogLevel::kError, tag, msg); }
    static void fatal(std::string_view tag, std::string_view msg) { write(LogLevel::kFatal, tag, msg); }
};

} // namespace gpo::core

#endif // GPO_CORE_LOG_HPP
