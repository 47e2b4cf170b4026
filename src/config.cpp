#include "config.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace portguard {

// GuardSettings implementation
GuardSettings::GuardSettings()
    : backup_directory(SystemUtils::getHomeDirectory() / "iptables-backups") {
}

std::filesystem::path GuardSettings::backupPath(AddressFamily family) const {
    return backup_directory / (family == AddressFamily::IPv4 ? backup_file_v4 : backup_file_v6);
}

bool GuardSettings::isValid() const {
    return getErrorMessage().empty();
}

std::string GuardSettings::getErrorMessage() const {
    std::string chain_error = validateChainName(chain);
    if (!chain_error.empty()) {
        return chain_error;
    }
    if (confirm_timeout.count() <= 0) {
        return "confirm_timeout must be greater than 0 seconds";
    }
    if (poll_interval.count() <= 0) {
        return "poll_interval must be greater than 0 milliseconds";
    }
    if (command_timeout.count() < 0) {
        return "command_timeout must not be negative";
    }
    if (retry.attempts < 1) {
        return "retry_attempts must be at least 1";
    }
    if (retry.backoff.count() < 0) {
        return "retry_backoff must not be negative";
    }
    if (backup_directory.empty()) {
        return "backup_directory must not be empty";
    }
    if (backup_file_v4.empty() || backup_file_v6.empty()) {
        return "backup file names must not be empty";
    }
    if (backup_file_v4 == backup_file_v6) {
        return "IPv4 and IPv6 backup files must differ";
    }
    return "";
}

// Config implementation
bool Config::isValid() const {
    return getErrorMessage().empty();
}

std::string Config::getErrorMessage() const {
    std::string guard_error = guard.getErrorMessage();
    if (!guard_error.empty()) {
        return "guard: " + guard_error;
    }

    if (block.empty()) {
        return "block: at least one port must be listed";
    }

    std::set<std::pair<Protocol, uint16_t>> seen;
    for (std::size_t i = 0; i < block.size(); ++i) {
        const auto& item = block[i];
        if (item.port == 0) {
            return "block[" + std::to_string(i) + "]: port must be between 1-65535";
        }
        if (!seen.insert({item.protocol, item.port}).second) {
            return "block[" + std::to_string(i) + "]: duplicate entry for " + item.label();
        }
    }
    return "";
}

std::string validateChainName(const std::string& chain) {
    if (chain.empty()) {
        return "Chain name cannot be empty";
    }

    // iptables limits chain names to 28 characters plus the terminator
    if (chain.length() > 28) {
        return "Chain name '" + chain + "' is longer than 28 characters";
    }

    // A leading hyphen would be read as an option
    if (chain.front() == '-') {
        return "Chain name '" + chain + "' cannot start with a hyphen";
    }

    for (char c : chain) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return "Chain name '" + chain + "' contains invalid characters. Only alphanumeric, underscore, hyphen, and dot are allowed.";
        }
    }
    return "";
}

} // namespace portguard

// YAML conversion implementations
namespace YAML {

using namespace portguard;

// Protocol conversion
YAML::Node convert<Protocol>::encode(const Protocol& protocol) {
    return Node(protocolToString(protocol));
}

bool convert<Protocol>::decode(const Node& node, Protocol& protocol) {
    if (!node.IsScalar()) return false;

    auto parsed = parseProtocol(node.as<std::string>());
    if (!parsed) {
        return false;
    }
    protocol = *parsed;
    return true;
}

// ChainPolicy conversion
YAML::Node convert<ChainPolicy>::encode(const ChainPolicy& policy) {
    switch (policy) {
        case ChainPolicy::Accept: return Node("accept");
        case ChainPolicy::Drop: return Node("drop");
    }
    return Node("accept");
}

bool convert<ChainPolicy>::decode(const Node& node, ChainPolicy& policy) {
    if (!node.IsScalar()) return false;

    std::string value = node.as<std::string>();
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);

    if (value == "accept") {
        policy = ChainPolicy::Accept;
    } else if (value == "drop") {
        policy = ChainPolicy::Drop;
    } else {
        return false;
    }
    return true;
}

// ChangeItem conversion
YAML::Node convert<ChangeItem>::encode(const ChangeItem& item) {
    Node node;
    node["protocol"] = item.protocol;
    node["port"] = static_cast<int>(item.port);
    node["action"] = "block";
    if (!item.description.empty()) {
        node["description"] = item.description;
    }
    return node;
}

bool convert<ChangeItem>::decode(const Node& node, ChangeItem& item) {
    if (!node.IsMap()) return false;

    if (!node["port"]) {
        return false; // Port is mandatory
    }

    // Decoded as int so that 0 reaches validation with a readable message
    int port = node["port"].as<int>();
    if (port < 0 || port > 65535) {
        return false;
    }
    item.port = static_cast<uint16_t>(port);

    if (node["protocol"]) {
        item.protocol = node["protocol"].as<Protocol>();
    }

    if (node["action"]) {
        std::string action = node["action"].as<std::string>();
        std::transform(action.begin(), action.end(), action.begin(), ::tolower);
        if (action != "block") {
            return false; // Only blocking changes are guarded
        }
    }
    item.action = ChangeAction::Block;

    if (node["description"]) {
        item.description = node["description"].as<std::string>();
    }
    return true;
}

// GuardSettings conversion
YAML::Node convert<GuardSettings>::encode(const GuardSettings& settings) {
    Node node;
    node["chain"] = settings.chain;
    node["expected_policy"] = settings.expected_policy;
    node["confirm_timeout"] = static_cast<long long>(settings.confirm_timeout.count());
    node["poll_interval"] = static_cast<long long>(settings.poll_interval.count());
    node["command_timeout"] = static_cast<long long>(settings.command_timeout.count());
    node["retry_attempts"] = settings.retry.attempts;
    node["retry_backoff"] = static_cast<long long>(settings.retry.backoff.count());
    node["backup_directory"] = settings.backup_directory.string();
    node["backup_file_v4"] = settings.backup_file_v4;
    node["backup_file_v6"] = settings.backup_file_v6;
    node["persist"] = settings.persist;
    return node;
}

bool convert<GuardSettings>::decode(const Node& node, GuardSettings& settings) {
    if (node.IsNull()) {
        return true; // "guard:" with no body keeps every default
    }
    if (!node.IsMap()) return false;

    static const std::set<std::string> known_keys = {
        "chain", "expected_policy", "confirm_timeout", "poll_interval", "command_timeout",
        "retry_attempts", "retry_backoff", "backup_directory", "backup_file_v4",
        "backup_file_v6", "persist"
    };
    for (const auto& entry : node) {
        std::string key = entry.first.as<std::string>();
        if (known_keys.count(key) == 0) {
            Logger::warning("Config", "Ignoring unknown guard setting '" + key + "'");
        }
    }

    if (node["chain"]) {
        settings.chain = node["chain"].as<std::string>();
    }
    if (node["expected_policy"]) {
        settings.expected_policy = node["expected_policy"].as<ChainPolicy>();
    }
    if (node["confirm_timeout"]) {
        settings.confirm_timeout = std::chrono::seconds(node["confirm_timeout"].as<long long>());
    }
    if (node["poll_interval"]) {
        settings.poll_interval = std::chrono::milliseconds(node["poll_interval"].as<long long>());
    }
    if (node["command_timeout"]) {
        settings.command_timeout = std::chrono::seconds(node["command_timeout"].as<long long>());
    }
    if (node["retry_attempts"]) {
        settings.retry.attempts = node["retry_attempts"].as<int>();
    }
    if (node["retry_backoff"]) {
        settings.retry.backoff = std::chrono::milliseconds(node["retry_backoff"].as<long long>());
    }
    if (node["backup_directory"]) {
        settings.backup_directory = SystemUtils::expandUserPath(node["backup_directory"].as<std::string>());
    }
    if (node["backup_file_v4"]) {
        settings.backup_file_v4 = node["backup_file_v4"].as<std::string>();
    }
    if (node["backup_file_v6"]) {
        settings.backup_file_v6 = node["backup_file_v6"].as<std::string>();
    }
    if (node["persist"]) {
        settings.persist = node["persist"].as<bool>();
    }
    return true;
}

// Config conversion
YAML::Node convert<Config>::encode(const Config& config) {
    Node node;
    node["guard"] = config.guard;
    for (const auto& item : config.block) {
        node["block"].push_back(item);
    }
    return node;
}

bool convert<Config>::decode(const Node& node, Config& config) {
    if (!node.IsMap()) return false;

    if (node["guard"]) {
        config.guard = node["guard"].as<GuardSettings>();
    }

    config.block.clear();
    if (node["block"]) {
        if (!node["block"].IsSequence()) {
            return false;
        }
        // Application order is the order of the YAML sequence
        for (const auto& entry : node["block"]) {
            config.block.push_back(entry.as<ChangeItem>());
        }
    }
    return true;
}

} // namespace YAML
