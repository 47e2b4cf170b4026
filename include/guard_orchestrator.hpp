/**
 * @file guard_orchestrator.hpp
 * @brief Guarded application of port blocking rules
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the GuardOrchestrator class, which drives one guarded
 * change through its state machine:
 *
 *     Init -> Verified -> BackedUp -> Applied -> AwaitingConfirmation
 *          -> Committed | RolledBack | RollbackPartial
 *
 * Nothing is mutated before the preconditions hold and a snapshot exists.
 * Once rules are applied, the operator has a bounded window to confirm the
 * change with SIGINT or SIGTERM; without confirmation, or after any apply
 * failure, the change is rolled back.
 */

#pragma once

#include "backup_manager.hpp"
#include "config.hpp"
#include "firewall_backend.hpp"
#include "rollback_strategy.hpp"
#include <atomic>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace portguard {

/**
 * @enum Phase
 * @brief States of a guarded change
 */
enum class Phase {
    Init,                 ///< Nothing checked yet
    Verified,             ///< Every precondition holds
    BackedUp,             ///< Snapshot written
    Applied,              ///< Every change item applied to both families
    AwaitingConfirmation, ///< Confirmation window open
    Committed,            ///< Change kept (terminal)
    RolledBack,           ///< Change reverted and verified (terminal)
    RollbackPartial       ///< Revert incomplete, manual recovery needed (terminal)
};

std::string phaseToString(Phase phase);

/**
 * @struct OrchestrationState
 * @brief Mutable state of one run
 *
 * Owned by the orchestrator for the lifetime of the run. `confirmed` is
 * the only member written from outside the main control flow (by the
 * signal handler or by GuardOrchestrator::confirm()).
 */
struct OrchestrationState {
    Phase phase = Phase::Init;
    bool backup_created = false;
    std::size_t changes_applied = 0;  ///< Successful append commands
    std::atomic<bool> confirmed{false};
};

/**
 * @struct GuardResult
 * @brief Outcome of a run that got as far as mutating the firewall
 */
struct GuardResult {
    Phase phase = Phase::Init;
    std::string failure;                    ///< Why rollback was entered, empty on commit
    std::optional<RollbackReport> rollback; ///< Present when rollback ran

    /**
     * @brief Process exit code for this outcome
     * @return 0 committed, 2 rolled back, 3 rollback partial, 1 otherwise
     */
    int exitCode() const;
};

/**
 * @class GuardOrchestrator
 * @brief Runs one guarded change against a firewall backend
 */
class GuardOrchestrator {
public:
    /**
     * @brief Construct an orchestrator
     * @param backend Firewall backend; must outlive the orchestrator
     * @param config Validated configuration
     */
    GuardOrchestrator(FirewallBackend& backend, const Config& config);

    /**
     * @brief Run the guarded change to a terminal state
     * @return Committed, RolledBack or RollbackPartial result
     * @throws PreconditionFailure if the host is not ready; nothing was changed
     * @throws BackupError if the snapshot could not be written; nothing was changed
     *
     * Apply failures and errors inside the confirmation window never
     * propagate: they lead to rollback and are described in the result.
     */
    GuardResult run();

    /**
     * @brief Check every precondition without side effects
     * @throws PreconditionFailure listing every problem found
     */
    void verifyPreconditions();

    /**
     * @brief Confirm the change as if SIGINT had been received
     *
     * Safe to call from any thread.
     */
    void confirm();

    const OrchestrationState& state() const { return state_; }

private:
    void createBackup();

    /**
     * @brief Append every change item, IPv4 then IPv6 per item
     * @throws ApplyFailure on the first failed append
     */
    void applyChanges();

    void showCurrentRules();

    /**
     * @brief Wait for confirmation or the deadline
     * @return true if confirmed, false on timeout
     */
    bool awaitConfirmation();

    GuardResult commit();
    GuardResult rollback(const std::string& reason);

    FirewallBackend& backend_;
    Config config_;
    BackupManager backups_;
    OrchestrationState state_;
    std::map<AddressFamily, std::vector<ChangeItem>> attempted_; ///< Per family, in order
};

} // namespace portguard
