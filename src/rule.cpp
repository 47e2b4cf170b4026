#include "rule.hpp"
#include <algorithm>
#include <cctype>

namespace portguard {

std::string ChangeItem::label() const {
    return protocolToString(protocol) + "/" + std::to_string(port);
}

std::string protocolToString(Protocol protocol) {
    // Lower case, as iptables prints and accepts it after -p
    switch (protocol) {
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
    }
    return "tcp";
}

std::optional<Protocol> parseProtocol(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

    if (lowered == "tcp") {
        return Protocol::Tcp;
    }
    if (lowered == "udp") {
        return Protocol::Udp;
    }
    return std::nullopt;
}

std::string familyToString(AddressFamily family) {
    return family == AddressFamily::IPv4 ? "IPv4" : "IPv6";
}

std::string familyToolName(AddressFamily family) {
    return family == AddressFamily::IPv4 ? "iptables" : "ip6tables";
}

std::string policyToString(ChainPolicy policy) {
    switch (policy) {
        case ChainPolicy::Accept:
            return "ACCEPT";
        case ChainPolicy::Drop:
            return "DROP";
    }
    return "ACCEPT";
}

std::optional<ChainPolicy> parsePolicy(const std::string& value) {
    // Policy names are matched exactly: iptables always prints them upper case
    if (value == "ACCEPT") {
        return ChainPolicy::Accept;
    }
    if (value == "DROP") {
        return ChainPolicy::Drop;
    }
    return std::nullopt;
}

RuleAction actionFromTarget(const std::string& target) {
    if (target == "DROP") {
        return RuleAction::Drop;
    }
    if (target == "REJECT") {
        return RuleAction::Reject;
    }
    if (target == "ACCEPT") {
        return RuleAction::Accept;
    }
    return RuleAction::Other;
}

} // namespace portguard
