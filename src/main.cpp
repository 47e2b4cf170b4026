#include <iostream>
#include <string>
#include <filesystem>
#include "cli_parser.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "guard_orchestrator.hpp"
#include "iptables_backend.hpp"
#include "logger.hpp"
#include "rule_verifier.hpp"

namespace {

// Print what a run would do without touching the firewall
void printPlan(const portguard::Config& config) {
    const auto& guard = config.guard;

    std::cout << "\nPlan:" << std::endl;
    std::cout << "  1. Verify " << guard.chain << " is empty with policy "
              << portguard::policyToString(guard.expected_policy) << " (IPv4 and IPv6)" << std::endl;
    std::cout << "  2. Snapshot rules to:" << std::endl;
    for (portguard::AddressFamily family : portguard::kAllFamilies) {
        std::cout << "       " << guard.backupPath(family).string() << std::endl;
    }
    std::cout << "  3. Apply:" << std::endl;
    for (const auto& item : config.block) {
        for (portguard::AddressFamily family : portguard::kAllFamilies) {
            std::cout << "       " << portguard::familyToolName(family) << " -A " << guard.chain
                      << " -p " << portguard::protocolToString(item.protocol)
                      << " --dport " << item.port << " -j DROP";
            if (!item.description.empty()) {
                std::cout << "  # " << item.description;
            }
            std::cout << std::endl;
        }
    }
    std::cout << "  4. Wait " << guard.confirm_timeout.count()
              << " seconds for CTRL+C / SIGTERM, otherwise roll back" << std::endl;
    std::cout << "  5. On confirmation: "
              << (guard.persist ? "netfilter-persistent save, then " : "")
              << "remove the snapshot" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto options = portguard::CLIParser::parse(argc, argv);

        if (options.help) {
            portguard::CLIParser::printUsage(argv[0]);
            return 0;
        }

        if (options.log_level) {
            portguard::Logger::setLevel(*options.log_level);
        }

        const auto& config_path = *options.config_file;

        // Early checks give clearer messages than the YAML parser would
        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Error: Configuration file does not exist: " << config_path.string() << std::endl;
            return 1;
        }
        if (!std::filesystem::is_regular_file(config_path)) {
            std::cerr << "Error: Path is not a regular file: " << config_path.string() << std::endl;
            return 1;
        }

        portguard::Config config = portguard::ConfigParser::loadFromFile(config_path.string());
        if (options.timeout) {
            config.guard.confirm_timeout = *options.timeout;
        }
        portguard::Logger::info("main", "Loaded " + std::to_string(config.block.size()) +
                                        " item(s) from " + config_path.string());

        if (options.dry_run) {
            std::cout << "Dry run: configuration is valid. No iptables rules were modified.\n" << std::endl;
            std::cout << portguard::ConfigParser::toYaml(config) << std::endl;
            printPlan(config);
            return 0;
        }

        portguard::IptablesBackend backend(config.guard.chain, config.guard.command_timeout,
                                           config.guard.persist);

        if (options.verify) {
            portguard::RuleVerifier verifier(backend);
            portguard::VerificationReport report = verifier.verify(config.block);
            portguard::RuleVerifier::printReport(report, std::cout);
            return report.exitCode();
        }

        portguard::GuardOrchestrator orchestrator(backend, config);
        portguard::GuardResult result = orchestrator.run();
        portguard::Logger::info("main", "Final state: " + portguard::phaseToString(result.phase));
        return result.exitCode();

    } catch (const portguard::PreconditionFailure& e) {
        std::cerr << "\nRefusing to change the firewall (" << e.problems().size()
                  << " problem(s) above). No changes were made." << std::endl;
        return 1;
    } catch (const portguard::BackupError& e) {
        std::cerr << "REFUSED: " << e.what() << std::endl;
        std::cerr << "No firewall rules were modified." << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        if (std::string(e.what()) == "No action specified") {
            portguard::CLIParser::printUsage(argv[0]);
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
        }
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "File system error: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Runtime error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        std::cerr << "Please report this issue with the command you were trying to execute." << std::endl;
        return 1;
    }
}
