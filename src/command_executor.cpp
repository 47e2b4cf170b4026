#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace portguard {

namespace {

const char* kComponent = "CommandExecutor";

// Keeps SIGPIPE ignored while we write to a child that may exit early
class ScopedIgnoreSigpipe {
public:
    ScopedIgnoreSigpipe() {
        struct sigaction ignore{};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }

    ~ScopedIgnoreSigpipe() {
        if (installed_) {
            sigaction(SIGPIPE, &previous_, nullptr);
        }
    }

    ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
    ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;

private:
    struct sigaction previous_{};
    bool installed_ = false;
};

} // namespace

CommandResult CommandResult::ok(const std::string& command, const std::string& output) {
    CommandResult result;
    result.success = true;
    result.exit_code = 0;
    result.stdout_output = output;
    result.command = command;
    return result;
}

CommandResult CommandResult::failure(const std::string& command, const std::string& error, int exit_code) {
    CommandResult result;
    result.success = false;
    result.exit_code = exit_code;
    result.stderr_output = error;
    result.command = command;
    return result;
}

CommandResult CommandExecutor::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult::failure("", "No command specified", -1);
    }

    return execute(argsToCommand(args));
}

CommandResult CommandExecutor::execute(const std::string& command) {
    if (command.empty()) {
        return CommandResult::failure("", "No command specified", -1);
    }

    Logger::debug(kComponent, "Executing command: " + command);

    // The "2>&1" redirection combines stderr into stdout for unified output capture
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen((command + " 2>&1").c_str(), "r"), pclose);

    if (!pipe) {
        std::string error = "Failed to execute command: " + command + " (" + std::strerror(errno) + ")";
        Logger::error(kComponent, error);
        return CommandResult::failure(command, error);
    }

    // Read command output in chunks using a fixed-size buffer
    std::array<char, 4096> buffer;
    std::string output;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe.release());

    CommandResult result;
    result.command = command;
    result.stdout_output = output;
    applyExitStatus(result, status, command.rfind("timeout ", 0) == 0);

    if (!result.isSuccess()) {
        // Keep the tool's own message where callers look for errors
        result.stderr_output = output;
    }

    std::string result_log = "Command completed with exit code " + std::to_string(result.exit_code);
    if (!output.empty()) {
        result_log += " (output: " + std::to_string(output.length()) + " bytes)";
    }
    Logger::log(result.isSuccess() ? LogLevel::Debug : LogLevel::Warning, kComponent, result_log);

    return result;
}

CommandResult CommandExecutor::executeWithTimeout(const std::vector<std::string>& args,
                                                  std::chrono::seconds timeout) {
    if (args.empty()) {
        return CommandResult::failure("", "No command specified", -1);
    }
    return execute(withTimeout(args, timeout));
}

CommandResult CommandExecutor::executeWithInput(const std::vector<std::string>& args,
                                                const std::string& input,
                                                std::chrono::seconds timeout) {
    if (args.empty()) {
        return CommandResult::failure("", "No command specified", -1);
    }

    std::vector<std::string> bounded = withTimeout(args, timeout);
    std::string command = argsToCommand(bounded);

    // popen() gives us one direction only; the output goes to a private file
    char output_path[] = "/tmp/portguard-output-XXXXXX";
    int fd = mkstemp(output_path);
    if (fd == -1) {
        std::string error = "Failed to create output capture file: " + std::string(std::strerror(errno));
        Logger::error(kComponent, error);
        return CommandResult::failure(command, error);
    }
    close(fd);

    Logger::debug(kComponent, "Executing command with " + std::to_string(input.size()) +
                              " bytes of input: " + command);

    std::string shell_command = command + " >" + escapeShellArg(output_path) + " 2>&1";

    CommandResult result;
    result.command = command;
    {
        ScopedIgnoreSigpipe ignore_sigpipe;
        std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(shell_command.c_str(), "w"), pclose);
        if (!pipe) {
            std::remove(output_path);
            std::string error = "Failed to execute command: " + command + " (" + std::strerror(errno) + ")";
            Logger::error(kComponent, error);
            return CommandResult::failure(command, error);
        }

        std::size_t written = fwrite(input.data(), 1, input.size(), pipe.get());
        if (written != input.size()) {
            Logger::warning(kComponent, "Command accepted only " + std::to_string(written) + " of " +
                                        std::to_string(input.size()) + " input bytes");
        }

        int status = pclose(pipe.release());
        applyExitStatus(result, status, !bounded.empty() && bounded.front() == "timeout");
    }

    std::ifstream output_file(output_path);
    std::ostringstream output;
    output << output_file.rdbuf();
    output_file.close();
    std::remove(output_path);

    result.stdout_output = output.str();
    if (!result.isSuccess()) {
        result.stderr_output = result.stdout_output;
    }

    Logger::log(result.isSuccess() ? LogLevel::Debug : LogLevel::Warning, kComponent,
                "Command completed with exit code " + std::to_string(result.exit_code));
    return result;
}

std::string CommandExecutor::argsToCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        return "";
    }

    std::ostringstream command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command << " ";
        }
        command << escapeShellArg(args[i]);
    }

    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    // If argument contains no special characters, return as-is
    if (!arg.empty() && arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~") == std::string::npos) {
        return arg;
    }

    // Escape argument with single quotes
    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";  // End quote, escaped single quote, start quote
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

std::vector<std::string> CommandExecutor::withTimeout(const std::vector<std::string>& args,
                                                      std::chrono::seconds timeout) {
    if (timeout.count() <= 0) {
        return args;
    }

    // SIGTERM at the deadline, SIGKILL five seconds later if the tool ignores it
    std::vector<std::string> bounded = {"timeout", "--kill-after=5", std::to_string(timeout.count())};
    bounded.insert(bounded.end(), args.begin(), args.end());
    return bounded;
}

void CommandExecutor::applyExitStatus(CommandResult& result, int status, bool bounded) {
    if (status == -1) {
        result.success = false;
        result.exit_code = -1;
        return;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + WTERMSIG(status);
    }

    // timeout(1) exits with 124, or 137 when it had to escalate to SIGKILL
    result.timed_out = bounded && (result.exit_code == kTimeoutExitCode || result.exit_code == 137);
    result.success = (result.exit_code == 0);
}

} // namespace portguard
