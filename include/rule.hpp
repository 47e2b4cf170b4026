/**
 * @file rule.hpp
 * @brief Rule model and common enumerations for portguard
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the value types shared by every portguard component:
 * the change items requested by the operator, the rules parsed back from
 * the live firewall, and the enumerations that describe protocols, address
 * families, chain policies and rule targets.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace portguard {

/**
 * @enum Protocol
 * @brief Network protocols supported by block rules
 */
enum class Protocol {
    Tcp, ///< TCP protocol
    Udp  ///< UDP protocol
};

/**
 * @enum AddressFamily
 * @brief Address family, each with its own independent chain
 *
 * IPv4 rules are managed with the iptables tool set, IPv6 rules with the
 * ip6tables tool set.
 */
enum class AddressFamily {
    IPv4, ///< iptables
    IPv6  ///< ip6tables
};

/// Both families, in the order changes are applied.
constexpr std::array<AddressFamily, 2> kAllFamilies = {AddressFamily::IPv4, AddressFamily::IPv6};

/**
 * @enum ChainPolicy
 * @brief Default action of a built-in chain
 */
enum class ChainPolicy {
    Accept, ///< Unmatched packets are accepted
    Drop    ///< Unmatched packets are dropped
};

/**
 * @enum RuleAction
 * @brief Terminal action of a parsed rule
 *
 * Anything that is not one of the three standard verdicts (a jump to a
 * user chain, LOG, RETURN, ...) is reported as Other.
 */
enum class RuleAction {
    Drop,   ///< DROP target
    Reject, ///< REJECT target
    Accept, ///< ACCEPT target
    Other   ///< Any other target
};

/**
 * @enum ChangeAction
 * @brief What a change item does to its port
 */
enum class ChangeAction {
    Block ///< Append a DROP rule
};

/**
 * @struct ChangeItem
 * @brief One port/protocol pair the operator wants blocked
 *
 * Change items are supplied as an ordered list at the start of a run and
 * never mutated. Identity is the (protocol, port) pair.
 */
struct ChangeItem {
    Protocol protocol = Protocol::Tcp;     ///< Protocol to block
    uint16_t port = 0;                     ///< Destination port (1-65535)
    ChangeAction action = ChangeAction::Block;
    std::string description;               ///< Free text shown to the operator

    /**
     * @brief Short identifier such as "tcp/902"
     */
    std::string label() const;

    bool sameTarget(const ChangeItem& other) const {
        return protocol == other.protocol && port == other.port;
    }
};

/**
 * @struct ParsedRule
 * @brief A rule read back from a chain listing
 *
 * Only rules carrying both a protocol and a destination port qualifier are
 * represented; other rules are out of scope for blocking decisions.
 */
struct ParsedRule {
    std::size_t ordinal = 0;               ///< 1-based position in the chain
    Protocol protocol = Protocol::Tcp;     ///< -p value
    uint16_t port = 0;                     ///< --dport value
    RuleAction action = RuleAction::Other; ///< Classified -j target
    std::string target;                    ///< Raw -j target
    std::string raw_line;                  ///< Original listing line

    bool matches(Protocol query_protocol, uint16_t query_port) const {
        return protocol == query_protocol && port == query_port;
    }

    bool isBlocking() const {
        return action == RuleAction::Drop || action == RuleAction::Reject;
    }
};

std::string protocolToString(Protocol protocol);

/**
 * @brief Parse "tcp" / "udp" (case insensitive)
 * @return Protocol, or std::nullopt for anything else
 */
std::optional<Protocol> parseProtocol(const std::string& value);

/**
 * @brief Human-readable family name ("IPv4" / "IPv6")
 */
std::string familyToString(AddressFamily family);

/**
 * @brief Name of the rule tool for a family ("iptables" / "ip6tables")
 */
std::string familyToolName(AddressFamily family);

std::string policyToString(ChainPolicy policy);

/**
 * @brief Parse an iptables policy name ("ACCEPT" / "DROP")
 * @return Policy, or std::nullopt for anything else
 */
std::optional<ChainPolicy> parsePolicy(const std::string& value);

/**
 * @brief Classify an iptables -j target
 */
RuleAction actionFromTarget(const std::string& target);

} // namespace portguard
