#include "iptables_backend.hpp"
#include "system_utils.hpp"
#include <utility>

namespace portguard {

IptablesBackend::IptablesBackend(std::string chain,
                                 std::chrono::seconds command_timeout,
                                 bool require_persistence)
    : chain_(std::move(chain))
    , command_timeout_(command_timeout)
    , require_persistence_(require_persistence) {
}

CommandResult IptablesBackend::dumpRules(AddressFamily family) {
    return CommandExecutor::executeWithTimeout({familyToolName(family) + "-save"}, command_timeout_);
}

CommandResult IptablesBackend::restoreRules(AddressFamily family, const std::string& dump) {
    // *-restore replaces every table named in the dump atomically
    return CommandExecutor::executeWithInput({familyToolName(family) + "-restore"}, dump, command_timeout_);
}

CommandResult IptablesBackend::appendBlockRule(AddressFamily family, Protocol protocol, uint16_t port) {
    return CommandExecutor::executeWithTimeout(blockRuleArgs(family, "-A", protocol, port), command_timeout_);
}

CommandResult IptablesBackend::deleteBlockRule(AddressFamily family, Protocol protocol, uint16_t port) {
    // -D with a rule specification removes the first matching rule only
    return CommandExecutor::executeWithTimeout(blockRuleArgs(family, "-D", protocol, port), command_timeout_);
}

CommandResult IptablesBackend::flushChain(AddressFamily family) {
    return CommandExecutor::executeWithTimeout({familyToolName(family), "-F", chain_}, command_timeout_);
}

CommandResult IptablesBackend::listChain(AddressFamily family) {
    return CommandExecutor::executeWithTimeout({familyToolName(family), "-S", chain_}, command_timeout_);
}

CommandResult IptablesBackend::persistRules() {
    return CommandExecutor::executeWithTimeout({"netfilter-persistent", "save"}, command_timeout_);
}

std::vector<std::string> IptablesBackend::checkEnvironment() {
    return SystemUtils::validateSystemRequirements(requiredCommands());
}

std::vector<std::string> IptablesBackend::requiredCommands() const {
    std::vector<std::string> commands = {
        "iptables", "ip6tables",
        "iptables-save", "ip6tables-save",
        "iptables-restore", "ip6tables-restore",
        "timeout",
    };
    if (require_persistence_) {
        commands.push_back("netfilter-persistent");
    }
    return commands;
}

std::vector<std::string> IptablesBackend::blockRuleArgs(AddressFamily family, const std::string& operation,
                                                        Protocol protocol, uint16_t port) const {
    return {
        familyToolName(family),
        operation, chain_,
        "-p", protocolToString(protocol),
        "--dport", std::to_string(port),
        "-j", "DROP"
    };
}

} // namespace portguard
