/**
 * @file firewall_backend.hpp
 * @brief Interface to the mechanism that reads and mutates the packet filter
 * @author portguard Development Team
 * @date 2024
 *
 * The orchestrator never runs firewall tools directly. Everything that
 * touches the live rule set goes through a FirewallBackend so the guarded
 * change logic can be exercised against an in-memory firewall in tests.
 */

#pragma once

#include "command_executor.hpp"
#include "rule.hpp"
#include <string>
#include <vector>

namespace portguard {

/**
 * @class FirewallBackend
 * @brief Command-execution collaborator for one host
 *
 * Every operation is synchronous, may be slow, and may fail; failures are
 * reported through CommandResult and never thrown. Text-returning
 * operations put their payload in CommandResult::stdout_output.
 */
class FirewallBackend {
public:
    virtual ~FirewallBackend() = default;

    /**
     * @brief Dump the complete rule set of a family (iptables-save format)
     */
    virtual CommandResult dumpRules(AddressFamily family) = 0;

    /**
     * @brief Replace the rule set of a family with a previous dump
     * @param family Address family
     * @param dump Text previously returned by dumpRules()
     */
    virtual CommandResult restoreRules(AddressFamily family, const std::string& dump) = 0;

    /**
     * @brief Append a DROP rule for a protocol/port to the managed chain
     */
    virtual CommandResult appendBlockRule(AddressFamily family, Protocol protocol, uint16_t port) = 0;

    /**
     * @brief Delete one DROP rule for a protocol/port from the managed chain
     */
    virtual CommandResult deleteBlockRule(AddressFamily family, Protocol protocol, uint16_t port) = 0;

    /**
     * @brief Remove every rule from the managed chain (policy is kept)
     */
    virtual CommandResult flushChain(AddressFamily family) = 0;

    /**
     * @brief List the managed chain in `-S` format
     */
    virtual CommandResult listChain(AddressFamily family) = 0;

    /**
     * @brief Save the live rule set of both families so it survives a reboot
     */
    virtual CommandResult persistRules() = 0;

    /**
     * @brief Check privileges and tool availability
     * @return Problems found; empty when the environment is ready
     */
    virtual std::vector<std::string> checkEnvironment() = 0;

    /**
     * @brief Name of the chain this backend manages (e.g. "INPUT")
     */
    virtual std::string chainName() const = 0;
};

} // namespace portguard
