/**
 * @file iptables_backend.hpp
 * @brief FirewallBackend implementation on top of the iptables tool set
 * @author portguard Development Team
 * @date 2024
 */

#pragma once

#include "firewall_backend.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace portguard {

/**
 * @class IptablesBackend
 * @brief Drives iptables/ip6tables and their save/restore companions
 *
 * Each call runs one external command through CommandExecutor, bounded by
 * the configured command timeout. Rules are persisted with
 * `netfilter-persistent save`.
 */
class IptablesBackend : public FirewallBackend {
public:
    /**
     * @brief Construct a backend for one chain
     * @param chain Chain to manage (usually "INPUT")
     * @param command_timeout Upper bound for every external command
     * @param require_persistence Whether netfilter-persistent must be installed
     */
    IptablesBackend(std::string chain,
                    std::chrono::seconds command_timeout,
                    bool require_persistence = true);

    CommandResult dumpRules(AddressFamily family) override;
    CommandResult restoreRules(AddressFamily family, const std::string& dump) override;
    CommandResult appendBlockRule(AddressFamily family, Protocol protocol, uint16_t port) override;
    CommandResult deleteBlockRule(AddressFamily family, Protocol protocol, uint16_t port) override;
    CommandResult flushChain(AddressFamily family) override;
    CommandResult listChain(AddressFamily family) override;
    CommandResult persistRules() override;
    std::vector<std::string> checkEnvironment() override;
    std::string chainName() const override { return chain_; }

    /**
     * @brief Commands that must be on PATH for a guarded change
     */
    std::vector<std::string> requiredCommands() const;

private:
    /**
     * @brief Build the argument vector of a block rule operation
     * @param family Address family selecting iptables or ip6tables
     * @param operation "-A" or "-D"
     */
    std::vector<std::string> blockRuleArgs(AddressFamily family, const std::string& operation,
                                           Protocol protocol, uint16_t port) const;

    std::string chain_;
    std::chrono::seconds command_timeout_;
    bool require_persistence_;
};

} // namespace portguard
