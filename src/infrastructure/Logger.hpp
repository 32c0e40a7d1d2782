/**
 * @file Logger.hpp
 * @brief Leveled console logging with the "[Component] message" convention.
 */

#pragma once
#include <optional>
#include <string>

namespace stablecopy::infrastructure {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

/**
 * @class Logger
 * @brief Writes timestamped records; debug/info to stdout, warnings/errors to stderr.
 *
 * The level threshold is set once at startup and is the only state kept here.
 */
class Logger {
public:
    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();

    /** @brief Parses "debug", "info", "warning"/"warn", "error" (case-insensitive). */
    static std::optional<LogLevel> ParseLevel(const std::string& name);

    static void Debug(const std::string& component, const std::string& message);
    static void Info(const std::string& component, const std::string& message);
    static void Warning(const std::string& component, const std::string& message);
    static void Error(const std::string& component, const std::string& message);

    /**
     * @brief Formats a failure record body: "<what> path=<p> op=<op> cause=<cause>".
     */
    static std::string Failure(const std::string& what, const std::string& path,
                               const std::string& op, const std::string& cause);

private:
    static void Write(LogLevel level, const std::string& component, const std::string& message);
};

} // namespace stablecopy::infrastructure
