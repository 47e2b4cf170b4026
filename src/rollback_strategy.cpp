#include "rollback_strategy.hpp"
#include "chain_inspector.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <iostream>
#include <thread>

namespace portguard {

namespace {
const char* kComponent = "Rollback";
}

std::string RestoreFromSnapshot::attempt(AddressFamily family) {
    // BackupManager::restore already retries; a false here means the snapshot is gone or unusable
    if (!backups_.restore(family)) {
        throw RollbackFailure(familyToString(family) + " restore from " +
                              backups_.snapshotPath(family).string() + " failed");
    }
    return familyToString(family) + " restored from " + backups_.snapshotPath(family).string();
}

std::string FlushChain::attempt(AddressFamily family) {
    const std::string chain = backend_.chainName();
    const std::string tool = familyToolName(family);
    const int attempts = retry_.attempts;

    std::string last_error;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        CommandResult result = backend_.flushChain(family);
        if (result.isSuccess()) {
            std::cout << "  [OK] " << familyToString(family) << " " << chain << " chain flushed" << std::endl;
            return familyToString(family) + " " + chain + " chain flushed";
        }

        last_error = result.getErrorMessage();
        std::cout << "  [RETRY " << attempt << "/" << attempts << "] " << tool
                  << " -F " << chain << " failed: " << last_error << std::endl;

        // No backoff after the last attempt
        if (attempt < attempts) {
            std::this_thread::sleep_for(retry_.backoff);
        }
    }

    throw RollbackFailure(tool + " -F " + chain + " failed after " +
                          std::to_string(attempts) + " attempts: " + last_error);
}

std::string DeleteRulesIndividually::attempt(AddressFamily family) {
    auto it = applied_.find(family);
    if (it == applied_.end() || it->second.empty()) {
        return "no " + familyToString(family) + " rules to delete";
    }

    const std::vector<ChangeItem>& items = it->second;
    std::vector<std::string> failed;
    // Reverse order of application. Every delete is tried once even after a failure
    for (auto item = items.rbegin(); item != items.rend(); ++item) {
        CommandResult result = backend_.deleteBlockRule(family, item->protocol, item->port);
        if (result.isSuccess()) {
            std::cout << "  [OK] Deleted " << familyToString(family) << " rule for "
                      << item->label() << std::endl;
        } else {
            std::cout << "  [FAIL] Could not delete " << familyToString(family) << " rule for "
                      << item->label() << ": " << result.getErrorMessage() << std::endl;
            failed.push_back(item->label());
        }
    }

    if (!failed.empty()) {
        std::string list;
        for (const auto& label : failed) {
            list += (list.empty() ? "" : ", ") + label;
        }
        throw RollbackFailure("Could not delete " + familyToString(family) + " rules: " + list);
    }
    return "deleted " + std::to_string(items.size()) + " " + familyToString(family) + " rule(s)";
}

RollbackExecutor::RollbackExecutor(FirewallBackend& backend,
                                   BackupManager& backups,
                                   std::vector<ChangeItem> items,
                                   std::map<AddressFamily, std::vector<ChangeItem>> applied,
                                   const GuardSettings& settings)
    : backend_(backend), backups_(backups), items_(std::move(items)) {
    // Most complete recovery first, most targeted last
    strategies_.push_back(std::make_unique<RestoreFromSnapshot>(backups_));
    strategies_.push_back(std::make_unique<FlushChain>(backend_, settings.retry));
    strategies_.push_back(std::make_unique<DeleteRulesIndividually>(backend_, std::move(applied)));
}

RollbackExecutor::RollbackExecutor(FirewallBackend& backend,
                                   BackupManager& backups,
                                   std::vector<ChangeItem> items,
                                   std::vector<std::unique_ptr<RecoveryStrategy>> strategies)
    : backend_(backend), backups_(backups), items_(std::move(items)),
      strategies_(std::move(strategies)) {
}

RollbackReport RollbackExecutor::run() {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "ROLLBACK IN PROGRESS" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    RollbackReport report;
    for (AddressFamily family : kAllFamilies) {
        report.families.push_back(recoverFamily(family));
    }

    // A strategy reporting success is not trusted on its own; re-read both chains
    std::cout << "\nVerifying rollback..." << std::endl;
    report.residual = verify();

    bool all_recovered = true;
    for (const auto& family : report.families) {
        all_recovered = all_recovered && family.succeeded;
    }

    // The snapshot is only discarded once the chains are known to be clean
    if (all_recovered && report.residual.empty()) {
        report.outcome = RollbackOutcome::RolledBack;
        std::cout << "  [OK] No guarded rules remain" << std::endl;
        backups_.discard();
    } else {
        report.outcome = RollbackOutcome::Partial;
        for (const auto& finding : report.residual) {
            std::cout << "  [FAIL] " << finding << std::endl;
        }
        report.retained_snapshots = backups_.existingSnapshotFiles();
        Logger::error(kComponent, "Rollback incomplete, manual recovery may be required");
    }

    return report;
}

FamilyRollback RollbackExecutor::recoverFamily(AddressFamily family) {
    FamilyRollback outcome;
    outcome.family = family;

    int step = 0;
    // Stop at the first strategy that succeeds for this family
    for (const auto& strategy : strategies_) {
        ++step;
        std::cout << "\nAttempt " << step << ": " << strategy->name() << " ("
                  << familyToString(family) << ")..." << std::endl;
        try {
            outcome.summary = strategy->attempt(family);
            outcome.succeeded = true;
            outcome.strategy = strategy->name();
            Logger::info(kComponent, familyToString(family) + ": " + outcome.summary);
            return outcome;
        } catch (const RollbackFailure& e) {
            Logger::warning(kComponent, strategy->name() + " failed: " + e.what());
            outcome.failures.push_back(strategy->name() + ": " + e.what());
        }
    }

    Logger::error(kComponent, "Every recovery strategy failed for " + familyToString(family));
    return outcome;
}

std::vector<std::string> RollbackExecutor::verify() {
    std::vector<std::string> findings;
    const std::string chain = backend_.chainName();

    for (AddressFamily family : kAllFamilies) {
        const std::string tool = familyToolName(family);
        CommandResult listing = backend_.listChain(family);
        if (!listing.isSuccess()) {
            // An unreadable chain counts as not rolled back
            findings.push_back(familyToString(family) + ": cannot list " + chain + " chain: " +
                               listing.getErrorMessage());
            continue;
        }

        ChainState state;
        try {
            state = ChainInspector::parse(listing.stdout_output, chain, tool);
        } catch (const FormatError& e) {
            findings.push_back(familyToString(family) + ": cannot verify " + chain + " chain: " + e.what());
            continue;
        }

        for (const auto& item : items_) {
            for (const auto& rule : ChainInspector::findRules(state, item.protocol, item.port)) {
                // Only DROP/REJECT rules matching a guarded port count as residue
                if (rule.isBlocking()) {
                    findings.push_back(familyToString(family) + ": rule still present: " + rule.raw_line);
                }
            }
        }
    }

    return findings;
}

} // namespace portguard
