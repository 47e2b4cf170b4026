#include "guard_orchestrator.hpp"
#include "chain_inspector.hpp"
#include "confirmation_signal.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace portguard {

namespace {

const char* kComponent = "GuardOrchestrator";

void printBanner(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(60, '=') << "\n" << std::endl;
}

std::string ruleCommand(AddressFamily family, const std::string& chain, const ChangeItem& item) {
    std::ostringstream cmd;
    cmd << std::left << std::setw(9) << familyToolName(family)
        << " -A " << chain << " -p " << protocolToString(item.protocol)
        << " --dport " << item.port << " -j DROP";
    return cmd.str();
}

std::string formatRemaining(long long seconds) {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << seconds / 60 << ":"
        << std::setw(2) << seconds % 60;
    return out.str();
}

} // namespace

std::string phaseToString(Phase phase) {
    switch (phase) {
        case Phase::Init: return "INIT";
        case Phase::Verified: return "VERIFIED";
        case Phase::BackedUp: return "BACKED_UP";
        case Phase::Applied: return "APPLIED";
        case Phase::AwaitingConfirmation: return "AWAITING_CONFIRMATION";
        case Phase::Committed: return "COMMITTED";
        case Phase::RolledBack: return "ROLLED_BACK";
        case Phase::RollbackPartial: return "ROLLBACK_PARTIAL";
        default: return "UNKNOWN";
    }
}

int GuardResult::exitCode() const {
    switch (phase) {
        case Phase::Committed: return 0;
        case Phase::RolledBack: return 2;
        case Phase::RollbackPartial: return 3;
        default: return 1;
    }
}

GuardOrchestrator::GuardOrchestrator(FirewallBackend& backend, const Config& config)
    : backend_(backend), config_(config), backups_(backend, config.guard) {
}

void GuardOrchestrator::confirm() {
    state_.confirmed.store(true);
}

GuardResult GuardOrchestrator::run() {
    printBanner("portguard: guarded port blocking\nwith automatic rollback after " +
                std::to_string(config_.guard.confirm_timeout.count()) + " seconds");

    // Read-only checks. Nothing has been changed if these throw
    verifyPreconditions();
    state_.phase = Phase::Verified;

    // A failed backup propagates; no rule is applied without a snapshot
    createBackup();
    state_.phase = Phase::BackedUp;

    // From here on the firewall may already carry our rules, so every failure
    // has to end in a rollback attempt.
    try {
        applyChanges();
        state_.phase = Phase::Applied;
        showCurrentRules();
    } catch (const ApplyFailure& e) {
        std::cout << "Initiating emergency rollback..." << std::endl;
        return rollback(e.what());
    } catch (const std::exception& e) {
        std::cout << "\nUnexpected error: " << e.what() << std::endl;
        std::cout << "Initiating emergency rollback..." << std::endl;
        return rollback(std::string("Error while applying rules: ") + e.what());
    }

    // A failure inside the wait loop is handled exactly like a timeout.
    bool confirmed = false;
    try {
        confirmed = awaitConfirmation();
    } catch (const std::exception& e) {
        std::cout << "\n\nUnexpected error: " << e.what() << std::endl;
        std::cout << "Initiating emergency rollback..." << std::endl;
        return rollback(std::string("Error while waiting for confirmation: ") + e.what());
    }

    if (confirmed) {
        return commit();
    }
    // Timeout without confirmation
    return rollback("No confirmation within " +
                    std::to_string(config_.guard.confirm_timeout.count()) + " seconds");
}

void GuardOrchestrator::verifyPreconditions() {
    printBanner("VERIFICATION PHASE");

    std::vector<std::string> problems;
    auto refuse = [&problems](const std::string& problem) {
        std::cout << "REFUSED: " << problem << std::endl;
        problems.push_back(problem);
    };

    const std::string chain = backend_.chainName();
    const std::string expected = policyToString(config_.guard.expected_policy);

    // Collect every problem before refusing so the operator sees them all at once
    std::vector<std::string> environment = backend_.checkEnvironment();
    for (const auto& problem : environment) {
        refuse(problem);
    }
    if (environment.empty()) {
        std::cout << "[OK] Running as root with all required commands available" << std::endl;
    }

    for (AddressFamily family : kAllFamilies) {
        const std::string tool = familyToolName(family);

        CommandResult listing = backend_.listChain(family);
        if (!listing.isSuccess()) {
            refuse("'" + tool + " -S " + chain + "' failed: " + listing.getErrorMessage());
            continue;
        }

        ChainState state;
        try {
            state = ChainInspector::parse(listing.stdout_output, chain, tool);
        } catch (const FormatError& e) {
            refuse(e.what());
            continue;
        }
        std::cout << "[OK] " << tool << " output format verified" << std::endl;

        // Any existing rule refuses, not just ones touching guarded ports
        if (!ChainInspector::isEmpty(state)) {
            refuse(tool + " " + chain + " chain is not empty (" +
                   std::to_string(state.total_rules) + " rule(s)); remove them with: sudo " +
                   tool + " -F " + chain);
        } else {
            std::cout << "[OK] " << tool << " " << chain << " chain is empty" << std::endl;
        }

        if (state.policy != config_.guard.expected_policy) {
            refuse(tool + " " + chain + " policy is " + policyToString(state.policy) +
                   ", expected " + expected);
        } else {
            std::cout << "[OK] " << tool << " " << chain << " policy is " << expected << std::endl;
        }
    }

    // Leftover snapshots mean an earlier run never finished; they must not be overwritten
    std::vector<std::filesystem::path> stale = backups_.existingSnapshotFiles();
    if (!stale.empty()) {
        std::string files;
        for (const auto& path : stale) {
            files += (files.empty() ? "" : ", ") + path.string();
        }
        refuse("Backup files from a previous run exist: " + files +
               " (restore them or remove them once the current state is known to be correct)");
    } else {
        std::cout << "[OK] No stale backup files" << std::endl;
    }

    if (!problems.empty()) {
        Logger::error(kComponent, std::to_string(problems.size()) + " precondition(s) failed");
        throw PreconditionFailure(std::move(problems));
    }

    std::cout << "\nAll verifications passed." << std::endl;
}

void GuardOrchestrator::createBackup() {
    printBanner("BACKUP PHASE");
    backups_.createSnapshot();
    state_.backup_created = true;
    std::cout << "Backup complete." << std::endl;
}

void GuardOrchestrator::applyChanges() {
    printBanner("APPLYING RULES");

    const std::string chain = backend_.chainName();
    for (const auto& item : config_.block) {
        for (AddressFamily family : kAllFamilies) {
            // Recorded before the call: a failed or timed out append may still have landed
            attempted_[family].push_back(item);

            CommandResult result = backend_.appendBlockRule(family, item.protocol, item.port);
            const std::string command = ruleCommand(family, chain, item);
            if (!result.isSuccess()) {
                std::cout << "FAILED: " << command << std::endl;
                std::cout << "error: " << result.getErrorMessage() << std::endl;
                // Stop at the first failure; the remaining items are never attempted
                throw ApplyFailure(familyToString(family) + " rule for " + item.label() +
                                   " could not be applied: " + result.getErrorMessage());
            }

            ++state_.changes_applied;
            std::cout << "[+] " << command;
            if (!item.description.empty()) {
                std::cout << "  # " << item.description;
            }
            std::cout << std::endl;
        }
    }

    std::cout << "\nAll rules applied successfully." << std::endl;
}

void GuardOrchestrator::showCurrentRules() {
    const std::string chain = backend_.chainName();
    std::cout << "\nCurrent state:" << std::endl;

    for (AddressFamily family : kAllFamilies) {
        const std::string tool = familyToolName(family);
        std::cout << "\n" << familyToString(family) << " (" << tool << " -S " << chain << "):" << std::endl;

        CommandResult listing = backend_.listChain(family);
        // Informational only, a listing failure here does not abort
        if (!listing.isSuccess()) {
            Logger::warning(kComponent, "Could not list " + tool + " " + chain + ": " +
                                        listing.getErrorMessage());
            continue;
        }

        std::istringstream lines(listing.stdout_output);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty()) {
                std::cout << "  " << line << std::endl;
            }
        }
    }
}

bool GuardOrchestrator::awaitConfirmation() {
    using std::chrono::steady_clock;

    // Handlers stay installed only for the duration of the wait
    ConfirmationSignal signal_guard(state_.confirmed);
    state_.phase = Phase::AwaitingConfirmation;

    const auto timeout = config_.guard.confirm_timeout;
    printBanner("WAITING FOR CONFIRMATION");
    std::cout << "Firewall rules have been applied TEMPORARILY.\n" << std::endl;
    std::cout << ">>> TEST YOUR CONNECTION NOW <<<" << std::endl;
    std::cout << "Open a NEW remote session to verify connectivity.\n" << std::endl;
    std::cout << "  Press CTRL+C  -->  COMMIT changes permanently" << std::endl;
    std::cout << "  Wait " << formatRemaining(timeout.count()) << "    -->  ROLLBACK automatically\n" << std::endl;

    const auto deadline = steady_clock::now() + timeout;
    long long last_reported = -1;

    while (true) {
        if (state_.confirmed.load()) {
            std::cout << "\n\nConfirmation received" << std::endl;
            return true;
        }

        const auto now = steady_clock::now();
        if (now >= deadline) {
            std::cout << "\n\nTimeout reached (" << timeout.count() << " seconds)." << std::endl;
            std::cout << "No confirmation received." << std::endl;
            return false;
        }

        // Report every 30 seconds, then every second for the last ten
        const long long remaining = std::chrono::ceil<std::chrono::seconds>(deadline - now).count();
        if (remaining != last_reported && (remaining % 30 == 0 || remaining < 10)) {
            std::cout << "  Time remaining: " << formatRemaining(remaining)
                      << "  [CTRL+C to commit]" << std::endl;
            last_reported = remaining;
        }

        // Never sleep past the deadline
        std::this_thread::sleep_for(std::min<steady_clock::duration>(config_.guard.poll_interval, deadline - now));
    }
}

GuardResult GuardOrchestrator::commit() {
    printBanner("COMMITTING CHANGES");

    // The rules are live either way; a persist failure only warns
    if (config_.guard.persist) {
        CommandResult result = backend_.persistRules();
        if (!result.isSuccess()) {
            std::cout << "WARNING: netfilter-persistent save failed: " << result.getErrorMessage() << std::endl;
            std::cout << "Rules are applied but may not persist after reboot." << std::endl;
            std::cout << "Try manually: sudo netfilter-persistent save" << std::endl;
            Logger::warning(kComponent, "Persisting rules failed");
        } else {
            std::cout << "Rules saved permanently. They will persist across reboots." << std::endl;
        }
    } else {
        std::cout << "Persistence disabled; rules are active until the next reboot." << std::endl;
    }

    std::cout << "\nCleaning up backup files..." << std::endl;
    backups_.discard();

    state_.phase = Phase::Committed;
    printBanner("SUCCESS: " + std::to_string(config_.block.size()) + " port(s) are now blocked.");

    GuardResult result;
    result.phase = Phase::Committed;
    return result;
}

GuardResult GuardOrchestrator::rollback(const std::string& reason) {
    Logger::warning(kComponent, "Rolling back: " + reason);

    // Per-rule deletes only cover what was actually attempted
    RollbackExecutor executor(backend_, backups_, config_.block, attempted_, config_.guard);
    RollbackReport report = executor.run();

    const std::string chain = backend_.chainName();
    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (report.rolledBack()) {
        state_.phase = Phase::RolledBack;
        std::cout << "ROLLBACK COMPLETE" << std::endl;
    } else {
        state_.phase = Phase::RollbackPartial;
        std::cout << "ROLLBACK PARTIALLY COMPLETE - MANUAL INTERVENTION MAY BE NEEDED" << std::endl;
        for (const auto& family : report.families) {
            if (!family.succeeded) {
                std::cout << "  " << familyToString(family.family) << ": every recovery attempt failed" << std::endl;
            }
        }
        std::cout << "\nTry manually:" << std::endl;
        for (AddressFamily family : kAllFamilies) {
            std::cout << "  sudo " << familyToolName(family) << " -F " << chain << std::endl;
        }
        if (!report.retained_snapshots.empty()) {
            std::cout << "\nBackup files preserved for manual recovery:" << std::endl;
            for (const auto& path : report.retained_snapshots) {
                std::cout << "  " << path.string() << std::endl;
            }
        }
    }
    std::cout << std::string(60, '=') << std::endl;

    GuardResult result;
    result.phase = state_.phase;
    result.failure = reason;
    result.rollback = std::move(report);
    return result;
}

} // namespace portguard
