/**
 * @file logger.hpp
 * @brief Leveled console logging for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the Logger class used by every portguard component for
 * diagnostic output. Messages carry a millisecond timestamp, a level tag and
 * the name of the emitting component. Errors and warnings go to stderr, all
 * other levels to stdout.
 */

#pragma once

#include <string>

namespace portguard {

/**
 * @enum LogLevel
 * @brief Logging levels
 *
 * Controls the verbosity of diagnostic output:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: All messages including detailed execution information
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
 * @brief Process-wide leveled logger
 *
 * All methods are static. The level is shared by every component so a
 * single --log-level option controls the whole program.
 */
class Logger {
public:
    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param component Name of the emitting component (e.g. "BackupManager")
     * @param message Message content to log
     *
     * Messages above the current level are dropped.
     */
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void error(const std::string& component, const std::string& message);
    static void warning(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void debug(const std::string& component, const std::string& message);

    /**
     * @brief Set the global logging level
     * @param level Logging level to set
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Get current logging level
     * @return Current logging level
     */
    static LogLevel getLevel();

    /**
     * @brief Parse a level name ("none", "error", "warning", "info", "debug")
     * @param name Level name, case insensitive
     * @return Parsed level
     * @throws std::invalid_argument for an unknown name
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Convert LogLevel enum to string representation
     * @param level LogLevel enum value
     * @return String representation of the log level
     */
    static std::string levelToString(LogLevel level);

private:
    static LogLevel current_level_; ///< Current global logging level
};

} // namespace portguard
