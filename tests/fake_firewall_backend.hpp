/**
 * @file fake_firewall_backend.hpp
 * @brief In-memory firewall for tests
 * @author portguard Development Team
 * @date 2024
 *
 * Simulates the managed chain of both address families, records every
 * command it receives and can be told to fail specific operations.
 * Failure keys look like "append:IPv4:tcp/912", "restore:IPv6",
 * "flush:IPv4", "delete:IPv6:udp/902", "dump:IPv4", "list:IPv6", "persist".
 */

#pragma once

#include "firewall_backend.hpp"
#include <cstdlib>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace portguard {
namespace testing {

class FakeFirewallBackend : public FirewallBackend {
public:
    struct Chain {
        ChainPolicy policy = ChainPolicy::Accept;
        std::vector<std::string> rules; ///< Rule specs without the "-A <chain>" prefix
    };

    explicit FakeFirewallBackend(std::string chain = "INPUT") : chain_(std::move(chain)) {
        chains[AddressFamily::IPv4];
        chains[AddressFamily::IPv6];
    }

    /// Fail the operation `times` times, or forever when times < 0
    void failOn(const std::string& key, int times = -1) { failures_[key] = times; }

    /// Replace the listing of a family with raw text
    void overrideListing(AddressFamily family, const std::string& text) { listing_override_[family] = text; }

    static std::string blockSpec(Protocol protocol, uint16_t port) {
        const std::string proto = protocolToString(protocol);
        return "-p " + proto + " -m " + proto + " --dport " + std::to_string(port) + " -j DROP";
    }

    bool hasBlockRule(AddressFamily family, Protocol protocol, uint16_t port) const {
        for (const auto& rule : chains.at(family).rules) {
            if (rule == blockSpec(protocol, port)) {
                return true;
            }
        }
        return false;
    }

    /// Commands that change the firewall
    std::vector<std::string> mutations() const {
        std::vector<std::string> result;
        for (const auto& command : commands) {
            if (command.rfind("list:", 0) != 0 && command.rfind("dump:", 0) != 0 &&
                command != "check-environment") {
                result.push_back(command);
            }
        }
        return result;
    }

    int count(const std::string& prefix) const {
        int n = 0;
        for (const auto& command : commands) {
            if (command.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    CommandResult dumpRules(AddressFamily family) override {
        const std::string key = "dump:" + familyToString(family);
        commands.push_back(key);
        if (shouldFail(key)) {
            return CommandResult::failure(key, "save failed");
        }

        const Chain& chain = chains[family];
        std::ostringstream out;
        out << "# Generated by fake\n*filter\n";
        out << ":" << chain_ << " " << policyToString(chain.policy) << " [0:0]\n";
        out << ":FORWARD ACCEPT [0:0]\n:OUTPUT ACCEPT [0:0]\n";
        for (const auto& rule : chain.rules) {
            out << "-A " << chain_ << " " << rule << "\n";
        }
        out << "COMMIT\n";
        return CommandResult::ok(key, out.str());
    }

    CommandResult restoreRules(AddressFamily family, const std::string& dump) override {
        const std::string key = "restore:" + familyToString(family);
        commands.push_back(key);
        if (shouldFail(key)) {
            return CommandResult::failure(key, "restore failed");
        }

        Chain restored;
        std::istringstream lines(dump);
        std::string line;
        const std::string policy_prefix = ":" + chain_ + " ";
        const std::string rule_prefix = "-A " + chain_ + " ";
        while (std::getline(lines, line)) {
            if (line.rfind(policy_prefix, 0) == 0) {
                std::string policy = line.substr(policy_prefix.size());
                policy = policy.substr(0, policy.find(' '));
                restored.policy = policy == "DROP" ? ChainPolicy::Drop : ChainPolicy::Accept;
            } else if (line.rfind(rule_prefix, 0) == 0) {
                restored.rules.push_back(line.substr(rule_prefix.size()));
            }
        }
        chains[family] = restored;
        return CommandResult::ok(key);
    }

    CommandResult appendBlockRule(AddressFamily family, Protocol protocol, uint16_t port) override {
        const std::string key = "append:" + familyToString(family) + ":" + label(protocol, port);
        commands.push_back(key);
        if (shouldFail(key)) {
            return CommandResult::failure(key, "iptables: append rejected");
        }
        chains[family].rules.push_back(blockSpec(protocol, port));
        return CommandResult::ok(key);
    }

    CommandResult deleteBlockRule(AddressFamily family, Protocol protocol, uint16_t port) override {
        const std::string key = "delete:" + familyToString(family) + ":" + label(protocol, port);
        commands.push_back(key);
        if (shouldFail(key)) {
            return CommandResult::failure(key, "delete rejected");
        }
        auto& rules = chains[family].rules;
        for (auto it = rules.begin(); it != rules.end(); ++it) {
            if (*it == blockSpec(protocol, port)) {
                rules.erase(it);
                return CommandResult::ok(key);
            }
        }
        return CommandResult::failure(key, "Bad rule (does a matching rule exist in that chain?)");
    }

    CommandResult flushChain(AddressFamily family) override {
        const std::string key = "flush:" + familyToString(family);
        commands.push_back(key);
        if (shouldFail(key)) {
            return CommandResult::failure(key, "flush failed");
        }
        chains[family].rules.clear();
        return CommandResult::ok(key);
    }

    CommandResult listChain(AddressFamily family) override {
        const std::string key = "list:" + familyToString(family);
        commands.push_back(key);
        if (shouldFail(key)) {
            return CommandResult::failure(key, "list failed");
        }

        auto override_it = listing_override_.find(family);
        if (override_it != listing_override_.end()) {
            return CommandResult::ok(key, override_it->second);
        }

        const Chain& chain = chains[family];
        std::string out = "-P " + chain_ + " " + policyToString(chain.policy) + "\n";
        for (const auto& rule : chain.rules) {
            out += "-A " + chain_ + " " + rule + "\n";
        }
        return CommandResult::ok(key, out);
    }

    CommandResult persistRules() override {
        commands.push_back("persist");
        if (shouldFail("persist")) {
            return CommandResult::failure("persist", "netfilter-persistent failed");
        }
        return CommandResult::ok("persist");
    }

    std::vector<std::string> checkEnvironment() override {
        commands.push_back("check-environment");
        return environment_problems;
    }

    std::string chainName() const override { return chain_; }

    std::map<AddressFamily, Chain> chains;
    std::vector<std::string> commands;
    std::vector<std::string> environment_problems;

private:
    static std::string label(Protocol protocol, uint16_t port) {
        return protocolToString(protocol) + "/" + std::to_string(port);
    }

    bool shouldFail(const std::string& key) {
        auto it = failures_.find(key);
        if (it == failures_.end() || it->second == 0) {
            return false;
        }
        if (it->second > 0) {
            --it->second;
        }
        return true;
    }

    std::string chain_;
    std::map<std::string, int> failures_;
    std::map<AddressFamily, std::string> listing_override_;
};

/**
 * @brief Scoped temporary directory
 */
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "portguard-test-XXXXXX").string();
        if (mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace testing
} // namespace portguard
