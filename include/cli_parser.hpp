/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the CLIParser class responsible for parsing and validating
 * command line arguments for the portguard application.
 */

#pragma once

#include "logger.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace portguard {

/**
 * @class CLIParser
 * @brief Command line interface parser for portguard
 *
 * The CLIParser class provides static methods for parsing command line arguments,
 * validating option combinations, and displaying help information. It uses
 * getopt_long and supports both short and long option formats.
 */
class CLIParser {
public:
    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        std::optional<std::filesystem::path> config_file; ///< Path to YAML configuration file
        bool verify = false;                              ///< Only report whether ports are blocked
        bool dry_run = false;                             ///< Validate and print the plan, change nothing
        std::optional<std::chrono::seconds> timeout;      ///< Overrides guard.confirm_timeout
        std::optional<LogLevel> log_level;                ///< Overrides the default log level
        bool help = false;                                ///< Display help information
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @param argc Number of command line arguments
     * @param argv Array of command line argument strings
     * @return Parsed options structure
     * @throws std::invalid_argument if argument parsing or option validation fails
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Print usage information to stdout
     * @param program_name Name of the program executable
     */
    static void printUsage(const std::string& program_name);

private:
    /**
     * @brief Validate parsed options for logical consistency
     * @param options The options structure to validate
     * @throws std::invalid_argument if options are inconsistent
     */
    static void validateOptions(const Options& options);

    /**
     * @brief Parse a positive number of seconds
     * @throws std::invalid_argument for anything else
     */
    static std::chrono::seconds parseSeconds(const std::string& value);
};

} // namespace portguard
