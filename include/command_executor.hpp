/**
 * @file command_executor.hpp
 * @brief Command execution engine for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the CommandExecutor class which runs the external
 * firewall tools (iptables, iptables-save, iptables-restore, ...). Every
 * invocation is synchronous, captures its output, and can be bounded by a
 * timeout so a hung tool cannot stall a rollback.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace portguard {

/**
 * @struct CommandResult
 * @brief Structure representing the result of a command execution
 *
 * Contains comprehensive information about command execution including
 * exit status, output streams, and helper methods for result analysis.
 * Used by all CommandExecutor methods to provide detailed execution feedback.
 */
struct CommandResult {
    bool success = false;           ///< Whether the command executed without errors
    int exit_code = -1;             ///< Process exit code (0 = success)
    bool timed_out = false;         ///< Whether the command was killed by its timeout
    std::string stdout_output;      ///< Standard output from the command
    std::string stderr_output;      ///< Standard error output from the command
    std::string command;            ///< The actual command that was executed

    /**
     * @brief Check if the command executed successfully
     * @return true if exit code is 0 and success flag is true
     */
    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief Get combined output (stdout + stderr)
     * @return Combined output string with newline separation
     */
    std::string getCombinedOutput() const {
        std::string combined = stdout_output;
        if (!stderr_output.empty()) {
            if (!combined.empty()) combined += "\n";
            combined += stderr_output;
        }
        return combined;
    }

    /**
     * @brief Get error message if command failed
     * @return Error message string or empty string if successful
     *
     * Generates a comprehensive error message including the command,
     * exit code, and error output when the command fails. Returns
     * empty string for successful commands.
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }

        std::string error = "Command failed: " + command;
        if (timed_out) {
            error += " (timed out)";
        } else {
            error += " (exit code: " + std::to_string(exit_code) + ")";
        }

        if (!stderr_output.empty()) {
            error += "\nError output: " + stderr_output;
        }

        return error;
    }

    /**
     * @brief Build a successful result carrying the given output
     */
    static CommandResult ok(const std::string& command, const std::string& output = "");

    /**
     * @brief Build a failed result carrying the given error text
     */
    static CommandResult failure(const std::string& command, const std::string& error, int exit_code = 1);
};

/**
 * @class CommandExecutor
 * @brief Command executor with structured results and logging
 *
 * All methods are static, making the class a utility interface that can be
 * used throughout the application without instantiation. Arguments passed
 * as a vector are shell-escaped before execution.
 */
class CommandExecutor {
public:
    /// Exit status reported by timeout(1) when the deadline expires.
    static constexpr int kTimeoutExitCode = 124;

    /**
     * @brief Execute a command given as an argument vector
     * @param args Command arguments (first is the command, rest are arguments)
     * @return CommandResult with comprehensive execution details
     *
     * Standard error is merged into stdout_output.
     */
    static CommandResult execute(const std::vector<std::string>& args);

    /**
     * @brief Execute a command from a single string
     * @param command Full command string to execute
     * @return CommandResult with comprehensive execution details
     *
     * The string is passed to the shell as-is, so redirections and pipes
     * are available but escaping is the caller's job.
     */
    static CommandResult execute(const std::string& command);

    /**
     * @brief Execute a command that is killed after a deadline
     * @param args Command arguments
     * @param timeout Maximum run time; zero disables the bound
     * @return CommandResult; timed_out is set when the deadline expired
     */
    static CommandResult executeWithTimeout(const std::vector<std::string>& args,
                                            std::chrono::seconds timeout);

    /**
     * @brief Execute a command feeding text to its standard input
     * @param args Command arguments
     * @param input Text written to the command's stdin
     * @param timeout Maximum run time; zero disables the bound
     * @return CommandResult with the command's combined output in stdout_output
     *
     * Used for the *-restore tools, which read a rule dump from stdin.
     */
    static CommandResult executeWithInput(const std::vector<std::string>& args,
                                          const std::string& input,
                                          std::chrono::seconds timeout);

    /**
     * @brief Convert vector of arguments to command string
     * @param args Command arguments vector
     * @return Properly escaped command string
     */
    static std::string argsToCommand(const std::vector<std::string>& args);

    /**
     * @brief Escape shell argument for safe execution
     * @param arg Argument string to escape
     * @return Escaped argument safe for shell execution
     *
     * Uses single quotes with proper escape handling; arguments without
     * special characters are returned unchanged.
     */
    static std::string escapeShellArg(const std::string& arg);

private:
    /**
     * @brief Prefix a command with timeout(1)
     */
    static std::vector<std::string> withTimeout(const std::vector<std::string>& args,
                                                std::chrono::seconds timeout);

    /**
     * @brief Decode a pclose()/system() status into the result fields
     */
    static void applyExitStatus(CommandResult& result, int status, bool bounded);
};

} // namespace portguard
