#include "cli_parser.hpp"
#include <iostream>
#include <stdexcept>
#include <getopt.h>

namespace portguard {

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    static struct option long_options[] = {
        {"verify",    no_argument,       0, 'v'},  // Report only, no changes
        {"dry-run",   no_argument,       0, 'n'},  // Validate config and print the plan
        {"timeout",   required_argument, 0, 't'},  // Confirmation window in seconds
        {"log-level", required_argument, 0, 'L'},  // none|error|warning|info|debug
        {"help",      no_argument,       0, 'h'},  // Show usage help
        {0, 0, 0, 0}
    };

    // glibc re-initialises its scanner when optind is 0, so parse() can run more than once
    optind = 0;

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "vnt:L:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'v':
                options.verify = true;
                break;
            case 'n':
                options.dry_run = true;
                break;
            case 't':
                options.timeout = parseSeconds(optarg);
                break;
            case 'L':
                // Throws std::invalid_argument for unknown level names
                options.log_level = Logger::parseLevel(optarg);
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long already printed the reason to stderr
                throw std::invalid_argument("Unknown option");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    if (optind < argc) {
        if (optind + 1 == argc) {
            options.config_file = std::filesystem::path(argv[optind]);
        } else {
            throw std::invalid_argument("Too many positional arguments");
        }
    }

    validateOptions(options);

    return options;
}

void CLIParser::validateOptions(const Options& options) {
    if (options.help) {
        return;
    }

    if (options.verify && options.dry_run) {
        throw std::invalid_argument("--verify conflicts with --dry-run");
    }

    if (options.verify && options.timeout.has_value()) {
        throw std::invalid_argument("--timeout has no effect with --verify");
    }

    if (!options.config_file.has_value()) {
        throw std::invalid_argument("No action specified");
    }
}

std::chrono::seconds CLIParser::parseSeconds(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("--timeout expects a positive number of seconds, got '" + value + "'");
    }

    unsigned long seconds = 0;
    try {
        seconds = std::stoul(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("--timeout value is too large: " + value);
    }

    if (seconds == 0 || seconds > 24UL * 60 * 60) {
        throw std::invalid_argument("--timeout must be between 1 and 86400 seconds");
    }
    return std::chrono::seconds(static_cast<long long>(seconds));
}

void CLIParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] CONFIG_FILE\n\n";
    std::cout << "Block ports with automatic rollback unless the change is confirmed\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  CONFIG_FILE    YAML file listing the ports to block\n\n";
    std::cout << "Options:\n";
    std::cout << "  -v, --verify           Only check that the listed ports are blocked\n";
    std::cout << "  -n, --dry-run          Validate the configuration and print the plan\n";
    std::cout << "  -t, --timeout SECONDS  Confirmation window (default from config, 300)\n";
    std::cout << "  -L, --log-level LEVEL  none, error, warning, info or debug (default info)\n";
    std::cout << "  -h, --help             Show this help message\n\n";
    std::cout << "While waiting for confirmation, CTRL+C (SIGINT) or SIGTERM keeps the change.\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0  committed, or every port blocked (--verify)\n";
    std::cout << "  1  refused, invalid configuration, or a port not blocked (--verify)\n";
    std::cout << "  2  rolled back\n";
    std::cout << "  3  rollback incomplete, manual recovery needed\n\n";
    std::cout << "Examples:\n";
    std::cout << "  sudo " << program_name << " block.yaml             Apply with a confirmation window\n";
    std::cout << "  sudo " << program_name << " -t 120 block.yaml      Two minute window\n";
    std::cout << "  sudo " << program_name << " --verify block.yaml    Check the live rules\n";
    std::cout << "  " << program_name << " --dry-run block.yaml        Show what would be done\n";
}

} // namespace portguard
