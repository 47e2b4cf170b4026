/**
 * @file rule_verifier.hpp
 * @brief Read-only check that the configured ports are blocked
 * @author portguard Development Team
 * @date 2024
 */

#pragma once

#include "chain_inspector.hpp"
#include "firewall_backend.hpp"
#include "rule.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace portguard {

/**
 * @struct CheckResult
 * @brief Verdict for one change item on both families
 */
struct CheckResult {
    bool passed = false;
    std::string message;              ///< One-line summary
    std::vector<std::string> details; ///< Reasons and, on failure, fix commands
};

/**
 * @struct VerificationReport
 * @brief Every check of a verification run
 */
struct VerificationReport {
    std::vector<CheckResult> results;
    std::vector<std::string> fatal;   ///< Listing or parse failures

    bool passed() const;

    /**
     * @return 0 if every item is blocked on both families, 1 otherwise
     */
    int exitCode() const { return passed() ? 0 : 1; }
};

/**
 * @class RuleVerifier
 * @brief Evaluates change items against the live chains without modifying them
 */
class RuleVerifier {
public:
    explicit RuleVerifier(FirewallBackend& backend) : backend_(backend) {}

    /**
     * @brief List and parse both chains, then check every item
     * @param items Items that should be blocked
     * @return Report; if a chain cannot be read the items are not checked
     */
    VerificationReport verify(const std::vector<ChangeItem>& items);

    /**
     * @brief Check one item against parsed chains
     * @param item Item that should be blocked
     * @param ipv4 Parsed IPv4 chain
     * @param ipv6 Parsed IPv6 chain
     * @param chain_name Chain name used in the fix commands
     */
    static CheckResult checkItem(const ChangeItem& item,
                                 const ChainState& ipv4,
                                 const ChainState& ipv6,
                                 const std::string& chain_name);

    /**
     * @brief Print a report the way the operator reads it
     */
    static void printReport(const VerificationReport& report, std::ostream& out);

private:
    FirewallBackend& backend_;
};

} // namespace portguard
