/**
 * @file Log.hpp
 * @brief Logging façade with runtime severity filtering and scoped overrides.
 *
 * A static Log class dispatches tagged messages to an injectable ILogger;
 * the default sink writes "[LEVEL][TAG] message" lines to stderr. The
 * numeric core only logs soft conditions (degenerate whiteners, rejected
 * weight updates) and leaves per-iteration reporting to observers.
 *
 * ScopedLogger and ScopedLogLevel temporarily redirect or filter the
 * output, e.g. to capture warnings in a test.
 *
 * @author MasterLaplace
 */
#pragma once

#ifndef LCCA_CORE_LOG_HPP
    #define LCCA_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace lcca::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "WHITEN", "WEIGHTS", "LCCA").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Every message carries a subsystem tag. All methods are thread-safe
 * provided the installed ILogger is thread-safe.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger (nullptr restores the stderr sink).
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);

    /// @brief True when a message of @p level would reach the sink.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    [[nodiscard]] static ILogger *logger();
    [[nodiscard]] static LogLevel minLevel();
};

/**
 * @brief Installs a logger for the lifetime of the guard.
 */
class ScopedLogger final {
public:
    explicit ScopedLogger(ILogger *logger) : _previous(Log::logger()) { Log::setLogger(logger); }
    ~ScopedLogger() { Log::setLogger(_previous); }

    ScopedLogger(const ScopedLogger &) = delete;
    ScopedLogger &operator=(const ScopedLogger &) = delete;

private:
    ILogger *_previous;
};

/**
 * @brief Overrides the minimum level for the lifetime of the guard.
 */
class ScopedLogLevel final {
public:
    explicit ScopedLogLevel(LogLevel level) : _previous(Log::minLevel()) { Log::setMinLevel(level); }
    ~ScopedLogLevel() { Log::setMinLevel(_previous); }

    ScopedLogLevel(const ScopedLogLevel &) = delete;
    ScopedLogLevel &operator=(const ScopedLogLevel &) = delete;

private:
    LogLevel _previous;
};

} // namespace lcca::core

#endif // LCCA_CORE_LOG_HPP
