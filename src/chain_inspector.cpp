#include "chain_inspector.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace portguard {

namespace {

const char* kComponent = "ChainInspector";

// Index of the first occurrence of an option token, or tokens.size()
std::size_t findOption(const std::vector<std::string>& tokens, const std::string& option) {
    auto it = std::find(tokens.begin(), tokens.end(), option);
    return static_cast<std::size_t>(std::distance(tokens.begin(), it));
}

bool isNegated(const std::vector<std::string>& tokens, std::size_t index) {
    return index > 0 && tokens[index - 1] == "!";
}

std::string quoted(const std::string& line) {
    return "'" + line + "'";
}

} // namespace

ListingLine ChainInspector::tokenizeLine(const std::string& line) {
    std::vector<std::string> tokens = splitTokens(line);

    if (tokens.size() < 2) {
        return UnrecognizedLine{"unexpected line format (too few parts)"};
    }

    if (tokens[0] == "-P") {
        if (tokens.size() != 3) {
            return UnrecognizedLine{"unexpected policy line format"};
        }
        return PolicyLine{tokens[1], tokens[2]};
    }

    if (tokens[0] == "-A") {
        return RuleLine{tokens[1], std::vector<std::string>(tokens.begin() + 2, tokens.end())};
    }

    return UnrecognizedLine{"unexpected line type " + quoted(tokens[0])};
}

ChainState ChainInspector::parse(const std::string& text, const std::string& chain, const std::string& source) {
    ChainState state;
    bool policy_seen = false;
    bool any_line = false;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        // Ignore blank lines, including a trailing newline of the command output
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); })) {
            continue;
        }

        ListingLine parsed = tokenizeLine(line);

        if (auto* unrecognized = std::get_if<UnrecognizedLine>(&parsed)) {
            throw FormatError(source + ": " + unrecognized->reason + ": " + quoted(line));
        }

        // The first non-blank line must declare the chain policy
        if (!any_line && !std::holds_alternative<PolicyLine>(parsed)) {
            throw FormatError(source + ": expected first line to be policy (-P " + chain +
                              " ...), got: " + quoted(line));
        }
        any_line = true;

        if (auto* policy_line = std::get_if<PolicyLine>(&parsed)) {
            if (policy_line->chain != chain) {
                throw FormatError(source + ": expected " + chain + " chain but got " +
                                  quoted(policy_line->chain) + ": " + quoted(line));
            }
            if (policy_seen) {
                throw FormatError(source + ": duplicate policy line: " + quoted(line));
            }
            auto policy = parsePolicy(policy_line->policy);
            if (!policy) {
                throw FormatError(source + ": unexpected policy " + quoted(policy_line->policy) +
                                  ": " + quoted(line));
            }
            state.policy = *policy;
            policy_seen = true;
            continue;
        }

        const RuleLine& rule_line = std::get<RuleLine>(parsed);
        if (rule_line.chain != chain) {
            // Rule for a different chain, not ours to judge
            continue;
        }

        state.total_rules++;
        const std::vector<std::string>& q = rule_line.qualifiers;

        // Every rule of the inspected chain must end in a verdict or jump
        std::size_t j_idx = findOption(q, "-j");
        if (j_idx + 1 >= q.size()) {
            throw FormatError(source + ": rule without -j action: " + quoted(line));
        }

        // Rule without -p, might be for all protocols - not a port rule
        std::size_t p_idx = findOption(q, "-p");
        if (p_idx + 1 >= q.size() || isNegated(q, p_idx)) {
            Logger::debug(kComponent, "Skipping rule without protocol qualifier: " + line);
            continue;
        }

        auto protocol = parseProtocol(q[p_idx + 1]);
        if (!protocol) {
            Logger::debug(kComponent, "Skipping non tcp/udp rule: " + line);
            continue;
        }

        std::size_t dport_idx = findOption(q, "--dport");
        if (dport_idx + 1 >= q.size() || isNegated(q, dport_idx)) {
            Logger::debug(kComponent, "Skipping rule without destination port: " + line);
            continue;
        }

        auto port = parsePort(q[dport_idx + 1]);
        if (!port) {
            // Port ranges ("1000:2000") and service names are not single-port rules
            Logger::debug(kComponent, "Skipping rule with non-numeric destination port: " + line);
            continue;
        }

        ParsedRule rule;
        rule.ordinal = state.total_rules;
        rule.protocol = *protocol;
        rule.port = *port;
        rule.target = q[j_idx + 1];
        rule.action = actionFromTarget(rule.target);
        rule.raw_line = line;
        state.rules.push_back(rule);
    }

    if (!any_line) {
        throw FormatError(source + " -S " + chain + " returned empty output");
    }

    return state;
}

BlockVerdict ChainInspector::isBlocked(const ChainState& chain, Protocol protocol, uint16_t port) {
    for (const auto& rule : chain.rules) {
        if (!rule.matches(protocol, port)) {
            continue;
        }

        std::string rule_ref = "rule #" + std::to_string(rule.ordinal);
        switch (rule.action) {
            case RuleAction::Drop:
            case RuleAction::Reject:
                return {true, "Blocked by " + rule_ref + " (" + rule.target + ")"};
            case RuleAction::Accept:
                return {false, "ACCEPTED by " + rule_ref + " BEFORE any DROP/REJECT"};
            case RuleAction::Other:
                return {false, "Unknown action '" + rule.target + "' in " + rule_ref};
        }
    }

    // No matching rule found - default policy applies
    if (chain.policy == ChainPolicy::Drop) {
        return {true, "No explicit rule, but default policy is DROP"};
    }
    return {false, "No DROP/REJECT rule found for this port"};
}

bool ChainInspector::isEmpty(const ChainState& chain) {
    return chain.total_rules == 0;
}

std::vector<ParsedRule> ChainInspector::findRules(const ChainState& chain, Protocol protocol, uint16_t port) {
    std::vector<ParsedRule> matching;
    std::copy_if(chain.rules.begin(), chain.rules.end(), std::back_inserter(matching),
                 [&](const ParsedRule& rule) { return rule.matches(protocol, port); });
    return matching;
}

std::string ChainInspector::serialize(const ChainState& chain, const std::string& chain_name) {
    std::ostringstream out;
    out << "-P " << chain_name << " " << policyToString(chain.policy) << "\n";

    for (const auto& rule : chain.rules) {
        const std::string protocol = protocolToString(rule.protocol);
        out << "-A " << chain_name
            << " -p " << protocol
            << " -m " << protocol
            << " --dport " << rule.port
            << " -j " << rule.target << "\n";
    }
    return out.str();
}

std::vector<std::string> ChainInspector::splitTokens(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<uint16_t> ChainInspector::parsePort(const std::string& token) {
    if (token.empty() || token.size() > 5 ||
        !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    unsigned long value = std::stoul(token);
    if (value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace portguard
