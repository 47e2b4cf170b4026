/**
 * @file system_utils.hpp
 * @brief System utilities and validation for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the SystemUtils class responsible for privilege and
 * tool-availability checks, and for resolving user-relative paths.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace portguard {

/**
 * @class SystemUtils
 * @brief System utilities and validation helper class
 *
 * Modifying the packet filter requires root privileges and the iptables
 * tool set on PATH; validateSystemRequirements() checks both.
 */
class SystemUtils {
public:
    /**
     * @brief Check if the current process is running with root privileges
     * @return true if the effective user ID is 0
     */
    static bool isRunningAsRoot();

    /**
     * @brief Check if a command is available on PATH
     * @param command Command name
     * @return true if the shell can resolve the command
     */
    static bool commandExists(const std::string& command);

    /**
     * @brief Get the name of the current system user
     * @return Username, or "unknown" if it cannot be resolved
     */
    static std::string getCurrentUser();

    /**
     * @brief Get the home directory of the current user
     * @return $HOME, falling back to the passwd entry, then "/root"
     */
    static std::filesystem::path getHomeDirectory();

    /**
     * @brief Expand a leading "~" to the home directory
     * @param path Path as written by the operator
     * @return Expanded path
     */
    static std::filesystem::path expandUserPath(const std::string& path);

    /**
     * @brief Validate privileges and required commands
     * @param required_commands Commands that must be on PATH
     * @return Problems found, empty if the system is ready
     *
     * Each missing command produces its own entry, followed by an
     * installation hint where one is known.
     */
    static std::vector<std::string> validateSystemRequirements(const std::vector<std::string>& required_commands);
};

} // namespace portguard
