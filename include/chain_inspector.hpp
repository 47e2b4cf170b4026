/**
 * @file chain_inspector.hpp
 * @brief Strict parser and evaluator for iptables chain listings
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the ChainInspector class which turns the output of
 * `iptables -S <chain>` (or `ip6tables -S <chain>`) into a ChainState and
 * answers whether a protocol/port pair is effectively blocked.
 *
 * The accepted listing format is line oriented:
 *
 *     -P INPUT ACCEPT
 *     -A INPUT -p tcp -m tcp --dport 902 -j DROP
 *     -A INPUT -p udp -m udp --dport 902 -j DROP
 *
 * The first non-blank line must declare the chain policy. Every following
 * line must be a rule declaration (`-A <chain> ...`). Anything else is
 * treated as schema drift and rejected with FormatError; the inspector is
 * used as a safety gate, so an unexpected observation must never be
 * silently ignored.
 */

#pragma once

#include "rule.hpp"
#include <string>
#include <optional>
#include <variant>
#include <vector>

namespace portguard {

/**
 * @struct ChainState
 * @brief Parsed view of one chain of one address family
 *
 * Re-derived from the live firewall on every inspection; never cached.
 */
struct ChainState {
    ChainPolicy policy = ChainPolicy::Accept; ///< Default policy
    std::vector<ParsedRule> rules;            ///< Tracked rules in evaluation order
    std::size_t total_rules = 0;              ///< All rules of the chain, tracked or not
};

/**
 * @struct BlockVerdict
 * @brief Result of evaluating a protocol/port pair against a chain
 */
struct BlockVerdict {
    bool blocked = false; ///< Whether new traffic to the port is dropped
    std::string reason;   ///< Which rule or policy decided it
};

/// `-P <chain> <policy>`
struct PolicyLine {
    std::string chain;
    std::string policy;
};

/// `-A <chain> <qualifiers...>`
struct RuleLine {
    std::string chain;
    std::vector<std::string> qualifiers; ///< Tokens after the two-token prefix
};

/// Anything that is neither a policy nor a rule declaration.
struct UnrecognizedLine {
    std::string reason;
};

/**
 * @brief One classified listing line
 */
using ListingLine = std::variant<PolicyLine, RuleLine, UnrecognizedLine>;

/**
 * @class ChainInspector
 * @brief Chain listing parser and block evaluator
 *
 * All methods are static and free of side effects.
 */
class ChainInspector {
public:
    /**
     * @brief Classify a single non-blank listing line
     * @param line Line text (surrounding whitespace is ignored)
     * @return PolicyLine, RuleLine or UnrecognizedLine
     *
     * Only checks the shape of the line. Chain names and policy values are
     * validated by parse().
     */
    static ListingLine tokenizeLine(const std::string& line);

    /**
     * @brief Parse a complete chain listing
     * @param text Output of `iptables -S <chain>`
     * @param chain Chain under inspection (e.g. "INPUT")
     * @param source Tool name used to prefix error messages
     * @return Parsed chain state
     * @throws FormatError when the text deviates from the expected format
     *
     * Rules for other chains are skipped. Rules without a tcp/udp protocol
     * qualifier or without a single numeric destination port are counted
     * for ordinals but not tracked. A rule of the inspected chain without
     * a `-j <target>` qualifier is an error.
     */
    static ChainState parse(const std::string& text,
                            const std::string& chain = "INPUT",
                            const std::string& source = "iptables");

    /**
     * @brief Decide whether a protocol/port pair is blocked
     * @param chain Parsed chain
     * @param protocol Protocol of the query
     * @param port Destination port of the query
     * @return Verdict with an explanation
     *
     * Rules are evaluated in order and the first matching rule decides:
     * DROP and REJECT block, ACCEPT allows, any other target allows with an
     * "unknown action" reason. Without a matching rule the chain policy
     * decides.
     */
    static BlockVerdict isBlocked(const ChainState& chain, Protocol protocol, uint16_t port);

    /**
     * @brief Check whether a chain carries no rules at all
     * @param chain Parsed chain
     * @return true if the listing only contained the policy line
     */
    static bool isEmpty(const ChainState& chain);

    /**
     * @brief Find every tracked rule for a protocol/port pair
     * @return Matching rules in evaluation order
     */
    static std::vector<ParsedRule> findRules(const ChainState& chain, Protocol protocol, uint16_t port);

    /**
     * @brief Render a chain state back to listing text
     * @param chain Parsed chain
     * @param chain_name Chain name to write in each line
     * @return Text that parse() reads back to an equal policy and rule set
     */
    static std::string serialize(const ChainState& chain, const std::string& chain_name = "INPUT");

private:
    static std::vector<std::string> splitTokens(const std::string& line);
    static std::optional<uint16_t> parsePort(const std::string& token);
};

} // namespace portguard
