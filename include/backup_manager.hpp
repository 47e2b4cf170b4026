/**
 * @file backup_manager.hpp
 * @brief Snapshot and restore of the packet filter state
 * @author portguard Development Team
 * @date 2024
 *
 * This file contains the BackupManager class. A snapshot is a pair of
 * files, one per address family, holding the output of iptables-save and
 * ip6tables-save taken before any mutation. The presence of either file is
 * itself meaningful: it marks a run that did not finish cleanly, and a new
 * run refuses to start until an operator has dealt with it.
 */

#pragma once

#include "config.hpp"
#include "firewall_backend.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace portguard {

/**
 * @struct Snapshot
 * @brief Locations of a written snapshot pair
 */
struct Snapshot {
    std::filesystem::path ipv4_path; ///< iptables-save payload
    std::filesystem::path ipv6_path; ///< ip6tables-save payload
};

/**
 * @class BackupManager
 * @brief Creates, replays and discards the snapshot pair
 */
class BackupManager {
public:
    /**
     * @brief Construct a manager for the snapshot location in the settings
     * @param backend Backend used to dump and restore rules
     * @param settings Snapshot paths and restore retry policy
     */
    BackupManager(FirewallBackend& backend, const GuardSettings& settings);

    /**
     * @brief Check whether either snapshot file is present
     */
    bool snapshotExists() const;

    /**
     * @brief List the snapshot files that are present
     * @return Existing paths, IPv4 first
     */
    std::vector<std::filesystem::path> existingSnapshotFiles() const;

    /**
     * @brief Dump both families to their snapshot files
     * @return Paths of the written files
     * @throws BackupError if a dump command fails or a file cannot be written
     *
     * The IPv4 file is written before the IPv6 dump runs. If the IPv6 half
     * fails, the IPv4 file is left in place; nothing has been mutated yet,
     * and the remaining file blocks the next run until it is inspected.
     */
    Snapshot createSnapshot();

    /**
     * @brief Replay the snapshot of one family
     * @param family Address family to restore
     * @return true once a restore attempt succeeds, false if the file is
     *         missing or unreadable or every attempt failed
     *
     * Retries according to the configured RetryPolicy.
     */
    bool restore(AddressFamily family);

    /**
     * @brief Delete both snapshot files
     *
     * Best effort: failures are logged and never escalated.
     */
    void discard();

    /**
     * @brief Snapshot path of one family
     */
    std::filesystem::path snapshotPath(AddressFamily family) const;

private:
    /**
     * @brief Write one family's dump to its snapshot file
     * @throws BackupError on any failure
     */
    void writeFamilySnapshot(AddressFamily family);

    FirewallBackend& backend_;
    GuardSettings settings_;
};

} // namespace portguard
