#include "system_utils.hpp"
#include "command_executor.hpp"
#include <cstdlib>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace portguard {

bool SystemUtils::isRunningAsRoot() {
    // Effective UID decides privileges; this covers sudo and setuid launches
    return geteuid() == 0;
}

bool SystemUtils::commandExists(const std::string& command) {
    // 'command -v' is a POSIX shell builtin and does not depend on which(1)
    std::string check_cmd = "command -v " + CommandExecutor::escapeShellArg(command) + " >/dev/null 2>&1";
    return std::system(check_cmd.c_str()) == 0;
}

std::string SystemUtils::getCurrentUser() {
    struct passwd* pw = getpwuid(geteuid());
    if (pw) {
        return std::string(pw->pw_name);
    }
    return "unknown";
}

std::filesystem::path SystemUtils::getHomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home);
    }

    struct passwd* pw = getpwuid(geteuid());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::filesystem::path(pw->pw_dir);
    }

    return std::filesystem::path("/root");
}

std::filesystem::path SystemUtils::expandUserPath(const std::string& path) {
    if (path == "~") {
        return getHomeDirectory();
    }
    if (path.rfind("~/", 0) == 0) {
        return getHomeDirectory() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::vector<std::string> SystemUtils::validateSystemRequirements(const std::vector<std::string>& required_commands) {
    std::vector<std::string> errors;

    // iptables needs CAP_NET_ADMIN, which in practice means root
    if (!isRunningAsRoot()) {
        errors.push_back("This program must be run as root (current user: " + getCurrentUser() +
                         ", effective UID " + std::to_string(geteuid()) + ")");
    }

    for (const auto& command : required_commands) {
        if (commandExists(command)) {
            continue;
        }

        errors.push_back("Required command '" + command + "' not found in PATH");
        if (command == "netfilter-persistent") {
            errors.push_back("Install with: apt install iptables-persistent "
                             "(answer YES to saving the current IPv4 and IPv6 rules)");
        } else if (command.find("tables") != std::string::npos) {
            errors.push_back("Install with: apt install iptables");
        }
    }

    return errors;
}

} // namespace portguard
