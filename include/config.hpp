/**
 * @file config.hpp
 * @brief Configuration structures and YAML serialization for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the configuration of a guarded change: the list of
 * ports to block and the guard settings (confirmation window, retry policy,
 * snapshot location, ...). It also provides YAML serialization through
 * yaml-cpp template specializations.
 *
 * Example:
 *
 *     guard:
 *       chain: INPUT
 *       expected_policy: accept
 *       confirm_timeout: 300
 *       backup_directory: ~/iptables-backups
 *     block:
 *       - protocol: tcp
 *         port: 902
 *         description: VMware Authentication Daemon
 */

#pragma once

#include "rule.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace portguard {

/**
 * @struct RetryPolicy
 * @brief Bounded, strictly sequential retry with a fixed backoff
 */
struct RetryPolicy {
    int attempts = 3;                              ///< Total attempts, at least 1
    std::chrono::milliseconds backoff{1000};       ///< Pause between attempts
};

/**
 * @struct GuardSettings
 * @brief Knobs of the guarded change state machine
 */
struct GuardSettings {
    std::string chain = "INPUT";                           ///< Chain to inspect and modify
    ChainPolicy expected_policy = ChainPolicy::Accept;     ///< Policy both families must have
    std::chrono::seconds confirm_timeout{300};             ///< Confirmation window
    std::chrono::milliseconds poll_interval{1000};         ///< Wait loop tick
    std::chrono::seconds command_timeout{30};              ///< Bound for each external command
    RetryPolicy retry;                                     ///< Restore and flush retries
    std::filesystem::path backup_directory;                ///< Snapshot directory
    std::string backup_file_v4 = "iptables-before-portguard.rules";
    std::string backup_file_v6 = "ip6tables-before-portguard.rules";
    bool persist = true;                                   ///< Save rules permanently on commit

    /**
     * @brief Defaults, with the snapshot directory under the user's home
     */
    GuardSettings();

    /**
     * @brief Full path of the snapshot file of a family
     */
    std::filesystem::path backupPath(AddressFamily family) const;

    /**
     * @brief Validate the settings
     * @return true if every value is in range
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid settings
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

/**
 * @struct Config
 * @brief Root configuration of portguard
 */
struct Config {
    GuardSettings guard;            ///< State machine settings
    std::vector<ChangeItem> block;  ///< Ports to block, in application order

    /**
     * @brief Validate the complete configuration
     * @return true if the settings and every change item are valid
     *
     * Checks that at least one item is given, that every port is in
     * 1-65535, and that no (protocol, port) pair appears twice.
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid configurations
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

/**
 * @brief Validate an iptables chain name
 * @return Empty string if valid, otherwise the reason
 */
std::string validateChainName(const std::string& chain);

}  // namespace portguard

/**
 * @namespace YAML
 * @brief YAML serialization template specializations
 */
namespace YAML {

/**
 * @brief YAML conversion for Protocol enum
 *
 * - Protocol::Tcp <-> "tcp"
 * - Protocol::Udp <-> "udp"
 */
template<>
struct convert<portguard::Protocol> {
    static Node encode(const portguard::Protocol& protocol);
    static bool decode(const Node& node, portguard::Protocol& protocol);
};

/**
 * @brief YAML conversion for ChainPolicy enum
 *
 * - ChainPolicy::Accept <-> "accept"
 * - ChainPolicy::Drop <-> "drop"
 */
template<>
struct convert<portguard::ChainPolicy> {
    static Node encode(const portguard::ChainPolicy& policy);
    static bool decode(const Node& node, portguard::ChainPolicy& policy);
};

/**
 * @brief YAML conversion for ChangeItem
 *
 * `port` is required; `protocol` defaults to tcp, `action` to block.
 */
template<>
struct convert<portguard::ChangeItem> {
    static Node encode(const portguard::ChangeItem& item);
    static bool decode(const Node& node, portguard::ChangeItem& item);
};

/**
 * @brief YAML conversion for GuardSettings
 *
 * Every key is optional and falls back to the GuardSettings default.
 */
template<>
struct convert<portguard::GuardSettings> {
    static Node encode(const portguard::GuardSettings& settings);
    static bool decode(const Node& node, portguard::GuardSettings& settings);
};

/**
 * @brief YAML conversion for Config
 */
template<>
struct convert<portguard::Config> {
    static Node encode(const portguard::Config& config);
    static bool decode(const Node& node, portguard::Config& config);
};

} // namespace YAML
