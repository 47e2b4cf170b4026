/**
 * @file rollback_strategy.hpp
 * @brief Escalating rollback of a guarded change
 * @author portguard Development Team
 * @date 2024
 *
 * Rollback is an ordered list of recovery strategies tried per address
 * family until one succeeds:
 *
 *   1. RestoreFromSnapshot     - replay the pre-change dump
 *   2. FlushChain              - empty the managed chain
 *   3. DeleteRulesIndividually - delete each applied rule, newest first
 *
 * Whatever the strategies report, the chains are then listed and parsed
 * again and any change item still present as a DROP/REJECT rule downgrades
 * the outcome to partial.
 */

#pragma once

#include "backup_manager.hpp"
#include "config.hpp"
#include "firewall_backend.hpp"
#include "rule.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace portguard {

/**
 * @class RecoveryStrategy
 * @brief One step of the rollback escalation
 *
 * Implementations must not depend on other strategies having run.
 */
class RecoveryStrategy {
public:
    virtual ~RecoveryStrategy() = default;

    /**
     * @brief Short name used in progress output
     */
    virtual std::string name() const = 0;

    /**
     * @brief Try to return one family to its pre-change state
     * @param family Address family to recover
     * @return Summary of what was done
     * @throws RollbackFailure when the strategy gave up
     */
    virtual std::string attempt(AddressFamily family) = 0;
};

/**
 * @class RestoreFromSnapshot
 * @brief Replays the snapshot with BackupManager::restore()
 */
class RestoreFromSnapshot : public RecoveryStrategy {
public:
    explicit RestoreFromSnapshot(BackupManager& backups) : backups_(backups) {}

    std::string name() const override { return "Restore from backup files"; }
    std::string attempt(AddressFamily family) override;

private:
    BackupManager& backups_;
};

/**
 * @class FlushChain
 * @brief Flushes the managed chain, retrying with a fixed backoff
 *
 * Weaker than a restore: the chain ends up empty rather than identical to
 * its pre-change state. The preconditions guarantee it was empty before.
 */
class FlushChain : public RecoveryStrategy {
public:
    FlushChain(FirewallBackend& backend, RetryPolicy retry)
        : backend_(backend), retry_(retry) {}

    std::string name() const override { return "Flush " + backend_.chainName() + " chain"; }
    std::string attempt(AddressFamily family) override;

private:
    FirewallBackend& backend_;
    RetryPolicy retry_;
};

/**
 * @class DeleteRulesIndividually
 * @brief Deletes each applied rule once, in reverse application order
 *
 * Succeeds only if every delete succeeded.
 */
class DeleteRulesIndividually : public RecoveryStrategy {
public:
    /**
     * @param backend Backend issuing the deletes
     * @param applied Items attempted per family, in application order
     */
    DeleteRulesIndividually(FirewallBackend& backend,
                            std::map<AddressFamily, std::vector<ChangeItem>> applied)
        : backend_(backend), applied_(std::move(applied)) {}

    std::string name() const override { return "Delete rules individually"; }
    std::string attempt(AddressFamily family) override;

private:
    FirewallBackend& backend_;
    std::map<AddressFamily, std::vector<ChangeItem>> applied_;
};

/**
 * @enum RollbackOutcome
 * @brief Final state of a rollback
 */
enum class RollbackOutcome {
    RolledBack, ///< Both families recovered and verified clean
    Partial     ///< Manual recovery may be needed
};

/**
 * @struct FamilyRollback
 * @brief What happened to one address family during rollback
 */
struct FamilyRollback {
    AddressFamily family = AddressFamily::IPv4;
    bool succeeded = false;            ///< Some strategy reported success
    std::string strategy;              ///< Name of the strategy that succeeded
    std::string summary;               ///< Its summary
    std::vector<std::string> failures; ///< Messages of the strategies that gave up
};

/**
 * @struct RollbackReport
 * @brief Full account of a rollback, for the operator and the exit code
 */
struct RollbackReport {
    RollbackOutcome outcome = RollbackOutcome::Partial;
    std::vector<FamilyRollback> families;                 ///< IPv4 then IPv6
    std::vector<std::string> residual;                    ///< Verification findings
    std::vector<std::filesystem::path> retained_snapshots; ///< Kept for manual recovery

    bool rolledBack() const { return outcome == RollbackOutcome::RolledBack; }
};

/**
 * @class RollbackExecutor
 * @brief Runs the recovery strategies for both families and verifies
 */
class RollbackExecutor {
public:
    /**
     * @brief Construct an executor with the standard three strategies
     * @param backend Firewall backend
     * @param backups Snapshot manager
     * @param items Every change item of the run (checked by verification)
     * @param applied Items attempted per family, in application order
     * @param settings Chain name and retry policy
     */
    RollbackExecutor(FirewallBackend& backend,
                     BackupManager& backups,
                     std::vector<ChangeItem> items,
                     std::map<AddressFamily, std::vector<ChangeItem>> applied,
                     const GuardSettings& settings);

    /**
     * @brief Construct an executor with a custom strategy list
     */
    RollbackExecutor(FirewallBackend& backend,
                     BackupManager& backups,
                     std::vector<ChangeItem> items,
                     std::vector<std::unique_ptr<RecoveryStrategy>> strategies);

    /**
     * @brief Run the escalation for both families, verify, and clean up
     * @return Report; snapshot files are removed only on RolledBack
     *
     * Never throws for a failed step; every failure lands in the report.
     */
    RollbackReport run();

private:
    FamilyRollback recoverFamily(AddressFamily family);
    std::vector<std::string> verify();

    FirewallBackend& backend_;
    BackupManager& backups_;
    std::vector<ChangeItem> items_;
    std::vector<std::unique_ptr<RecoveryStrategy>> strategies_;
};

} // namespace portguard
