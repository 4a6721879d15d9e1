/**
 * @file logger.hpp
 * @brief Leveled console logging for web-blocker
 * @author web-blocker Development Team
 * @date 2026
 *
 * This file contains the Logger class used by every component to report
 * progress, warnings and errors with a timestamp and a component tag.
 */

#pragma once

#include <string>

namespace webblock {

/**
 * @enum LogLevel
 * @brief Logging levels
 *
 * Controls the verbosity of console output:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: All messages including executed commands
 */
enum class LogLevel {
    None,    ///< No logging
    Error,   ///< Error messages only
    Warning, ///< Error and warning messages
    Info,    ///< Informational messages and above
    Debug    ///< All messages including debug information
};

/**
 * @class Logger
 * @brief Process-wide timestamped logger
 *
 * Messages are written as "[timestamp] [LEVEL] Component: message".
 * Errors and warnings go to stderr, everything else to stdout. All
 * methods are static; the level is global to the process.
 */
class Logger {
public:
    /**
     * @brief Set the global logging level
     * @param level Highest level that will still be printed
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Get the current logging level
     * @return Current global logging level
     */
    static LogLevel getLevel();

    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param component Name of the reporting component
     * @param message Message content to log
     */
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void error(const std::string& component, const std::string& message) {
        log(LogLevel::Error, component, message);
    }
    static void warning(const std::string& component, const std::string& message) {
        log(LogLevel::Warning, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        log(LogLevel::Info, component, message);
    }
    static void debug(const std::string& component, const std::string& message) {
        log(LogLevel::Debug, component, message);
    }

    /**
     * @brief Convert LogLevel enum to string representation
     * @param level LogLevel enum value
     * @return Lower-case name as used in the configuration file
     */
    static std::string levelToString(LogLevel level);

    /**
     * @brief Parse a level name from the configuration file
     * @param name One of none, error, warning, info, debug (case-insensitive)
     * @return Matching LogLevel
     * @throws std::invalid_argument if the name is unknown
     */
    static LogLevel levelFromString(const std::string& name);

private:
    static LogLevel current_level_; ///< Current global logging level
};

} // namespace webblock
