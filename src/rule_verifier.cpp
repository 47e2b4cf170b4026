#include "rule_verifier.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <map>

namespace portguard {

bool VerificationReport::passed() const {
    if (!fatal.empty()) {
        return false;
    }
    // Every port must pass; an empty item list passes trivially
    for (const auto& result : results) {
        if (!result.passed) {
            return false;
        }
    }
    return true;
}

VerificationReport RuleVerifier::verify(const std::vector<ChangeItem>& items) {
    VerificationReport report;
    const std::string chain = backend_.chainName();

    std::map<AddressFamily, ChainState> states;
    for (AddressFamily family : kAllFamilies) {
        const std::string tool = familyToolName(family);
        CommandResult listing = backend_.listChain(family);
        if (!listing.isSuccess()) {
            report.fatal.push_back("Failed to list " + tool + " rules: " + listing.getErrorMessage());
            continue;
        }
        // Output we cannot parse is never read as "not blocked"
        try {
            states[family] = ChainInspector::parse(listing.stdout_output, chain, tool);
        } catch (const FormatError& e) {
            report.fatal.push_back("Failed to parse " + tool + " rules: " + e.what());
        }
    }

    // No per-port results without both listings
    if (!report.fatal.empty()) {
        Logger::error("RuleVerifier", "Cannot verify rules: chain listing unavailable");
        return report;
    }

    for (const auto& item : items) {
        report.results.push_back(checkItem(item, states[AddressFamily::IPv4],
                                           states[AddressFamily::IPv6], chain));
    }
    return report;
}

CheckResult RuleVerifier::checkItem(const ChangeItem& item,
                                    const ChainState& ipv4,
                                    const ChainState& ipv6,
                                    const std::string& chain_name) {
    const BlockVerdict v4 = ChainInspector::isBlocked(ipv4, item.protocol, item.port);
    const BlockVerdict v6 = ChainInspector::isBlocked(ipv6, item.protocol, item.port);
    const std::string port_label = std::to_string(item.port) + "/" + protocolToString(item.protocol);

    CheckResult result;
    if (!item.description.empty()) {
        result.details.push_back("Service: " + item.description);
    }

    // A port only passes when both families block it
    if (v4.blocked && v6.blocked) {
        result.passed = true;
        result.message = "Port " + port_label + " is blocked (IPv4 and IPv6)";
        result.details.push_back("IPv4: " + v4.reason);
        result.details.push_back("IPv6: " + v6.reason);
        return result;
    }

    result.message = "Port " + port_label + " is NOT fully blocked!";
    if (!v4.blocked) {
        result.details.push_back("IPv4: " + v4.reason);
    }
    if (!v6.blocked) {
        result.details.push_back("IPv6: " + v6.reason);
    }
    result.details.push_back("Fix with:");
    // Fix commands only for the families still open
    for (AddressFamily family : kAllFamilies) {
        const bool blocked = family == AddressFamily::IPv4 ? v4.blocked : v6.blocked;
        if (!blocked) {
            result.details.push_back("  sudo " + familyToolName(family) + " -A " + chain_name +
                                     " -p " + protocolToString(item.protocol) +
                                     " --dport " + std::to_string(item.port) + " -j DROP");
        }
    }
    return result;
}

void RuleVerifier::printReport(const VerificationReport& report, std::ostream& out) {
    out << "\n" << std::string(70, '=') << "\n";
    out << "  iptables Rules Verification\n";
    out << std::string(70, '=') << "\n";

    for (const auto& message : report.fatal) {
        out << "[FATAL] " << message << "\n";
    }
    if (!report.fatal.empty()) {
        out << "[SKIP] Cannot verify rules due to the failure above.\n";
    }

    for (const auto& result : report.results) {
        out << (result.passed ? "[PASS] " : "[FAIL] ") << result.message << "\n";
        for (const auto& line : result.details) {
            out << "       " << line << "\n";
        }
    }

    out << "\n";
    if (report.passed()) {
        out << "All checked ports are blocked.\n";
    } else {
        out << "One or more checks failed!\n";
        out << "Please review the failures above and take corrective action.\n";
    }
    out.flush();
}

} // namespace portguard
